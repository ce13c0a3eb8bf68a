#pragma once

#include <safekeeper/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Escrow workflow: canonical key prefixes and key codecs for ledger state,
// history and events. Numeric key parts are big-endian so that RocksDB
// iteration order matches numeric order.
namespace safekeeper::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kTreasuryKey{"SYS|STATE|TREASURY"};
inline constexpr std::string_view kTreasureKeyPrefix{"SYS|STATE|TREASURE|"};
inline constexpr std::string_view kDepositorIndexPrefix{
    "SYS|STATE|DEPOSITOR|"};
inline constexpr std::string_view kBeneficiaryIndexPrefix{
    "SYS|STATE|BENEFICIARY|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
inline constexpr std::string_view kBlockTimeKey{"SYS|STATE|BLOCK_TIME"};
inline constexpr std::string_view kChainIdKey{"SYS|META|CHAIN_ID"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

safekeeper::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const safekeeper::schema::bytes_view_t& suffix);

safekeeper::schema::bytes_t make_treasure_key(
    safekeeper::schema::treasure_id_t treasure_id);
safekeeper::schema::bytes_t make_depositor_index_key(
    const safekeeper::schema::account_id_t& depositor);
safekeeper::schema::bytes_t make_beneficiary_index_key(
    const safekeeper::schema::account_id_t& beneficiary);
safekeeper::schema::bytes_t make_balance_key(
    const safekeeper::schema::account_id_t& account);
safekeeper::schema::bytes_t make_nonce_key(
    const safekeeper::schema::account_id_t& signer);
safekeeper::schema::bytes_t make_history_key(uint64_t height, uint32_t index);
safekeeper::schema::bytes_t make_event_key(uint64_t event_id);

/// Recover the account id that follows `prefix` in an account-keyed row.
std::optional<safekeeper::schema::account_id_t> parse_account_key(
    std::string_view prefix,
    const safekeeper::schema::bytes_view_t& key);

}  // namespace safekeeper::schema::key
