#pragma once

#include <safekeeper/execution/signature_verifier.hpp>
#include <safekeeper/execution/signing.hpp>
#include <safekeeper/ledger/collaborators.hpp>
#include <safekeeper/ledger/treasury.hpp>
#include <safekeeper/schema/app_info.hpp>
#include <safekeeper/schema/block_result.hpp>
#include <safekeeper/schema/commit_result.hpp>
#include <safekeeper/schema/encoding/encoder.hpp>
#include <safekeeper/schema/history_entry.hpp>
#include <safekeeper/schema/ledger_error_code.hpp>
#include <safekeeper/schema/ledger_event.hpp>
#include <safekeeper/schema/primitives.hpp>
#include <safekeeper/schema/query_result.hpp>
#include <safekeeper/schema/transaction.hpp>
#include <safekeeper/schema/transaction_result.hpp>
#include <safekeeper/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safekeeper::execution {

inline constexpr std::string_view kCheckTxCodespace{"safekeeper.checktx"};
inline constexpr std::string_view kFinalizeCodespace{"safekeeper.finalize"};
inline constexpr std::string_view kLedgerCodespace{"safekeeper.ledger"};
inline constexpr std::string_view kQueryCodespace{"safekeeper.query"};

/// Deterministic escrow state machine driven by ordered blocks.
///
/// The engine decodes and authenticates transactions, feeds the block time
/// to the treasury as its clock, executes payloads against the treasury,
/// and persists state, history and events on commit. Payouts are credited
/// to custodial balances unless another value transfer is installed.
class engine final {
 public:
  /// Construct the engine over an open storage backend.
  ///
  /// Persisted state wins over `config`; the config only seeds an empty
  /// database. `require_strict_crypto` enables signature verification, which
  /// is otherwise bypassed.
  explicit engine(
      safekeeper::schema::encoding::encoder<
          safekeeper::schema::encoding::scale_encoder_tag>& encoder,
      safekeeper::storage::storage<safekeeper::storage::rocksdb_storage_tag>&
          storage,
      const safekeeper::ledger::treasury_config& config = {},
      bool require_strict_crypto = false,
      std::string_view chain_name = kDefaultChainName);

  /// Admit a transaction (CheckTx semantics). Never mutates state.
  safekeeper::schema::transaction_result_t check_transaction(
      const safekeeper::schema::bytes_view_t& raw_tx);

  /// Execute a block in order at `block_time` and compute its state root.
  ///
  /// Every transaction gets a result, failed ones included. Only successful
  /// transactions advance the signer nonce and the state root.
  safekeeper::schema::block_result_t finalize_block(
      uint64_t height,
      safekeeper::schema::timestamp_seconds_t block_time,
      const std::vector<safekeeper::schema::bytes_t>& txs);

  /// Persist the finalized block in a single write batch.
  safekeeper::schema::commit_result_t commit();

  safekeeper::schema::app_info_t info() const;

  /// Read committed state by route. See the route table in engine.cpp.
  safekeeper::schema::query_result_t query(
      std::string_view path,
      const safekeeper::schema::bytes_view_t& data);

  /// Committed history entries with height in [from_height, to_height].
  std::vector<safekeeper::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Committed event records with height in [from_height, to_height].
  std::vector<safekeeper::schema::event_record_t> events(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Replace the default balance-crediting transfer.
  void set_value_transfer(safekeeper::ledger::value_transfer_t transfer);

  const safekeeper::schema::hash32_t& chain_id() const;

 private:
  safekeeper::schema::transaction_result_t execute_operation(
      const safekeeper::schema::transaction_t& tx);

  /// Validate envelope, payload version, signer, nonce and signature.
  safekeeper::schema::transaction_result_t validate_transaction(
      const safekeeper::schema::transaction_t& tx,
      std::string_view codespace) const;

  uint64_t expected_nonce(const safekeeper::schema::account_id_t& signer) const;
  bool credit_balance(const safekeeper::schema::account_id_t& recipient,
                      const safekeeper::schema::amount_t& amount);
  std::vector<safekeeper::storage::key_value_entry_t> make_state_rows();
  void load_persisted_state(const safekeeper::ledger::treasury_config& config,
                            std::string_view chain_name);

  mutable std::mutex mutex_;
  safekeeper::schema::encoding::encoder<
      safekeeper::schema::encoding::scale_encoder_tag>& encoder_;
  safekeeper::storage::storage<safekeeper::storage::rocksdb_storage_tag>&
      storage_;
  std::unique_ptr<safekeeper::ledger::treasury> treasury_;
  std::map<safekeeper::schema::account_id_t, safekeeper::schema::amount_t>
      balances_;
  std::map<safekeeper::schema::account_id_t, uint64_t> nonces_;
  std::vector<safekeeper::schema::history_entry_t> pending_history_;
  std::vector<safekeeper::schema::event_record_t> pending_events_;
  uint64_t next_event_id_{};
  int64_t last_committed_height_{};
  safekeeper::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  safekeeper::schema::hash32_t pending_state_root_{};
  safekeeper::schema::timestamp_seconds_t current_block_time_{};
  safekeeper::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{false};
  signature_verifier_t signature_verifier_;
};

}  // namespace safekeeper::execution
