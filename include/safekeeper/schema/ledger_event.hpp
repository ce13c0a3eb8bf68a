#pragma once
#include <safekeeper/schema/primitives.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

// Schema type: ledger events.
// Escrow workflow: append-only notifications emitted by successful ledger
// operations, in the order the operations executed.
namespace safekeeper::schema {

struct treasure_stored_t final {
  account_id_t depositor{};
  account_id_t beneficiary{};
  amount_t amount{};
  timestamp_seconds_t unlock_time{};
  treasure_id_t treasure_id{};
};

struct treasure_claimed_t final {
  account_id_t beneficiary{};
  amount_t amount{};
  treasure_id_t treasure_id{};
};

struct fee_updated_t final {
  basis_points_t fee_basis_points{};
};

struct fees_withdrawn_t final {
  account_id_t recipient{};
  amount_t amount{};
};

struct ownership_transferred_t final {
  account_id_t previous_owner{};
  account_id_t new_owner{};
};

using ledger_event_t = std::variant<treasure_stored_t,
                                    treasure_claimed_t,
                                    fee_updated_t,
                                    fees_withdrawn_t,
                                    ownership_transferred_t>;

std::string_view event_type(const ledger_event_t& event);

template <uint16_t Version>
struct event_record;

/// Event as persisted by the engine, positioned by block and transaction.
template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  timestamp_seconds_t block_time{};
  ledger_event_t event{};
};

using event_record_t = event_record<1>;

}  // namespace safekeeper::schema
