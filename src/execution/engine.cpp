#include <spdlog/spdlog.h>
#include <safekeeper/blake3/hash.hpp>
#include <safekeeper/common/critical.hpp>
#include <safekeeper/crypto/verify.hpp>
#include <safekeeper/execution/engine.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>
#include <safekeeper/schema/key/engine_keys.hpp>
#include <safekeeper/schema/query_error_code.hpp>
#include <algorithm>
#include <limits>
#include <set>
#include <string>
#include <tuple>
#include <utility>

using namespace safekeeper::schema;

namespace {

using encoder_t = safekeeper::schema::encoding::scale_encoder_t;
using storage_t =
    safekeeper::storage::storage<safekeeper::storage::rocksdb_storage_tag>;

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  return safekeeper::blake3::hasher{}
      .update(bytes_view_t{seed.data(), seed.size()})
      .update(bytes_view_t{tx.data(), tx.size()})
      .update(bytes_view_t{encoded_suffix.data(), encoded_suffix.size()})
      .finalize();
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_failure(const ledger_error_code code,
                                  std::string_view codespace,
                                  std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

uint16_t payload_version(const transaction_payload_t& payload) {
  return std::visit([](const auto& value) { return value.version; }, payload);
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const store_treasure_t&) { return std::string_view{"store"}; },
          [](const claim_treasure_t&) { return std::string_view{"claim"}; },
          [](const set_fee_basis_points_t&) {
            return std::string_view{"set_fee_basis_points"};
          },
          [](const withdraw_fees_t&) {
            return std::string_view{"withdraw_fees"};
          },
          [](const transfer_ownership_t&) {
            return std::string_view{"transfer_ownership"};
          },
          [](const renounce_ownership_t&) {
            return std::string_view{"renounce_ownership"};
          }},
      payload);
}

template <typename T>
transaction_result_t to_transaction_result(
    encoder_t& encoder,
    safekeeper::ledger::ledger_result<T>&& outcome,
    std::string_view operation) {
  if (!outcome.ok()) {
    return make_failure(outcome.code, safekeeper::execution::kLedgerCodespace);
  }
  auto result = transaction_result_t{};
  result.data = encoder.encode(outcome.value.value());
  result.info = std::string{operation} + " accepted";
  result.events = std::move(outcome.events);
  return result;
}

std::vector<history_entry_t> load_history(const storage_t& storage,
                                          encoder_t& encoder,
                                          uint64_t from_height,
                                          uint64_t to_height) {
  auto out = std::vector<history_entry_t>{};
  auto rows =
      storage.list_by_prefix(make_bytes_view(safekeeper::schema::key::kHistoryPrefix));
  for (const auto& [key, value] : rows) {
    auto entry = encoder.decode<history_entry_t>(make_bytes_view(value));
    if (entry.height >= from_height && entry.height <= to_height) {
      out.push_back(std::move(entry));
    }
  }
  return out;
}

std::vector<event_record_t> load_events(const storage_t& storage,
                                        encoder_t& encoder,
                                        uint64_t from_height,
                                        uint64_t to_height) {
  auto out = std::vector<event_record_t>{};
  auto rows =
      storage.list_by_prefix(make_bytes_view(safekeeper::schema::key::kEventPrefix));
  for (const auto& [key, value] : rows) {
    auto record = encoder.decode<event_record_t>(make_bytes_view(value));
    if (record.height >= from_height && record.height <= to_height) {
      out.push_back(std::move(record));
    }
  }
  return out;
}

}  // namespace

namespace safekeeper::execution {

engine::engine(encoding::encoder<encoding::scale_encoder_tag>& encoder,
               storage::storage<storage::rocksdb_storage_tag>& storage,
               const ledger::treasury_config& config,
               bool require_strict_crypto,
               std::string_view chain_name)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(config, chain_name);
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  } else if (!crypto::available()) {
    spdlog::warn("OpenSSL lacks Ed25519; every signature will be rejected");
  }
  spdlog::info("Execution engine ready at height {} with {} treasure(s)",
               last_committed_height_, treasury_->treasures().size());
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_failure(ledger_error_code::invalid_transaction,
                        kCheckTxCodespace, decode_error);
  }
  return validate_transaction(*maybe_tx, kCheckTxCodespace);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    std::string_view codespace) const {
  if (tx.version != 1 || payload_version(tx.payload) != 1) {
    return make_failure(ledger_error_code::unsupported_transaction_version,
                        codespace, "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_failure(ledger_error_code::invalid_chain_id, codespace);
  }
  if (is_null_account(tx.signer)) {
    return make_failure(ledger_error_code::invalid_signer, codespace);
  }
  auto expected = expected_nonce(tx.signer);
  if (tx.nonce != expected) {
    return make_failure(ledger_error_code::invalid_nonce, codespace,
                        "expected nonce " + std::to_string(expected));
  }
  if (require_strict_crypto_) {
    auto message = make_signing_message(tx);
    if (!signature_verifier_ ||
        !signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_failure(ledger_error_code::signature_verification_failed,
                          codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  const auto& caller = tx.signer;
  try {
    return std::visit(
        overloaded{
            [&](const store_treasure_t& payload) {
              return to_transaction_result(
                  encoder_,
                  treasury_->store(caller, payload.beneficiary,
                                   payload.unlock_time, payload.value),
                  payload_name(tx.payload));
            },
            [&](const claim_treasure_t& payload) {
              return to_transaction_result(
                  encoder_, treasury_->claim(payload.treasure_id, caller),
                  payload_name(tx.payload));
            },
            [&](const set_fee_basis_points_t& payload) {
              return to_transaction_result(
                  encoder_,
                  treasury_->set_fee_basis_points(caller,
                                                  payload.fee_basis_points),
                  payload_name(tx.payload));
            },
            [&](const withdraw_fees_t& payload) {
              return to_transaction_result(
                  encoder_, treasury_->withdraw_fees(caller, payload.recipient),
                  payload_name(tx.payload));
            },
            [&](const transfer_ownership_t& payload) {
              return to_transaction_result(
                  encoder_,
                  treasury_->transfer_ownership(caller, payload.new_owner),
                  payload_name(tx.payload));
            },
            [&](const renounce_ownership_t&) {
              return to_transaction_result(
                  encoder_, treasury_->renounce_ownership(caller),
                  payload_name(tx.payload));
            }},
        tx.payload);
  } catch (const std::exception& ex) {
    spdlog::error("{} from {} failed in value transfer: {}",
                  payload_name(tx.payload), to_hex(caller), ex.what());
    return make_failure(ledger_error_code::transfer_failed, kLedgerCodespace,
                        ex.what());
  }
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  const auto latest_height = std::max(last_committed_height_, pending_height_);
  if (static_cast<int64_t>(height) <= latest_height) {
    spdlog::warn("Block {} is not above height {}; skipping {} transaction(s)",
                 height, latest_height, txs.size());
    auto skipped = block_result_t{};
    skipped.tx_results.assign(
        txs.size(),
        make_failure(ledger_error_code::invalid_transaction,
                     kFinalizeCodespace,
                     "block height " + std::to_string(height) +
                         " already finalized"));
    skipped.state_root = pending_state_root_;
    return skipped;
  }

  if (block_time < current_block_time_) {
    spdlog::warn("Block {} time {} is behind {}; keeping the later time",
                 height, block_time, current_block_time_);
  } else {
    current_block_time_ = block_time;
  }

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  auto rolling_root = pending_state_root_;
  auto failed = size_t{0};

  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(make_bytes_view(txs[i]), decode_error);

    auto tx_result = transaction_result_t{};
    if (!maybe_tx) {
      tx_result = make_failure(ledger_error_code::invalid_transaction,
                               kFinalizeCodespace, decode_error);
    } else {
      tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace);
      if (tx_result.code == 0) {
        tx_result = execute_operation(*maybe_tx);
      }
    }

    if (tx_result.code == 0) {
      nonces_[maybe_tx->signer] = maybe_tx->nonce + 1;
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      for (const auto& event : tx_result.events) {
        pending_events_.push_back(event_record_t{.event_id = next_event_id_++,
                                                 .height = height,
                                                 .tx_index = index,
                                                 .block_time =
                                                     current_block_time_,
                                                 .event = event});
      }
    } else {
      ++failed;
      spdlog::debug("Transaction {} in block {} rejected: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }

    pending_history_.push_back(history_entry_t{
        .height = height, .index = index, .code = tx_result.code, .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {} transaction(s), {} failed", height,
               txs.size(), failed);
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  auto appended = std::vector<storage::key_value_entry_t>{};
  appended.reserve(pending_history_.size() + pending_events_.size());
  for (const auto& entry : pending_history_) {
    appended.emplace_back(key::make_history_key(entry.height, entry.index),
                          encoder_.encode(entry));
  }
  for (const auto& record : pending_events_) {
    appended.emplace_back(key::make_event_key(record.event_id),
                          encoder_.encode(record));
  }

  storage_.commit_block(make_bytes_view(key::kStatePrefix), make_state_rows(),
                        appended,
                        storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = last_committed_state_root_});
  spdlog::debug("Committed height {} ({} history row(s), {} event(s))",
                last_committed_height_, pending_history_.size(),
                pending_events_.size());
  pending_history_.clear();
  pending_events_.clear();

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

// Routes, all answered from committed storage:
//   /engine/info              -> (height, state_root, chain_id)
//   /treasury/state           -> treasury_state_t
//   /treasure/details         u64 id -> treasure_t
//   /treasure/by_depositor    account -> vector<u64>
//   /treasure/by_beneficiary  account -> vector<u64>
//   /account/balance          account -> amount_t
//   /account/nonce            account -> next expected nonce
//   /events/range             (from, to) -> vector<event_record_t>
//   /history/range            (from, to) -> vector<history_entry_t>
query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.height = last_committed_height_;
  result.key = make_bytes(data);

  auto fail = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    result.codespace = std::string{kQueryCodespace};
    return result;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/treasury/state") {
    auto state = storage_.get<treasury_state_t>(
        encoder_, make_bytes_view(key::kTreasuryKey));
    if (!state) {
      return fail(query_error_code::not_found, "treasury state not found");
    }
    result.value = encoder_.encode(*state);
    return result;
  }

  if (path == "/treasure/details") {
    auto treasure_id = encoder_.try_decode<uint64_t>(data);
    if (!treasure_id) {
      return fail(query_error_code::invalid_key, "expected u64 treasure id");
    }
    auto treasure_key = key::make_treasure_key(*treasure_id);
    auto treasure =
        storage_.get<treasure_t>(encoder_, make_bytes_view(treasure_key));
    if (!treasure) {
      return fail(query_error_code::not_found, "treasure not found");
    }
    result.value = encoder_.encode(*treasure);
    return result;
  }

  if (path == "/treasure/by_depositor" || path == "/treasure/by_beneficiary" ||
      path == "/account/balance" || path == "/account/nonce") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return fail(query_error_code::invalid_key, "expected 32 byte account");
    }
    if (path == "/treasure/by_depositor") {
      auto index_key = key::make_depositor_index_key(*account);
      result.value = encoder_.encode(
          storage_
              .get<std::vector<treasure_id_t>>(encoder_,
                                               make_bytes_view(index_key))
              .value_or(std::vector<treasure_id_t>{}));
    } else if (path == "/treasure/by_beneficiary") {
      auto index_key = key::make_beneficiary_index_key(*account);
      result.value = encoder_.encode(
          storage_
              .get<std::vector<treasure_id_t>>(encoder_,
                                               make_bytes_view(index_key))
              .value_or(std::vector<treasure_id_t>{}));
    } else if (path == "/account/balance") {
      auto balance_key = key::make_balance_key(*account);
      result.value = encoder_.encode(
          storage_.get<amount_t>(encoder_, make_bytes_view(balance_key))
              .value_or(amount_t{0}));
    } else {
      auto nonce_key = key::make_nonce_key(*account);
      result.value = encoder_.encode(
          storage_.get<uint64_t>(encoder_, make_bytes_view(nonce_key))
              .value_or(uint64_t{1}));
    }
    return result;
  }

  if (path == "/events/range" || path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected (from, to) range");
    }
    auto [from_height, to_height] = *range;
    if (path == "/events/range") {
      result.value = encoder_.encode(
          load_events(storage_, encoder_, from_height, to_height));
    } else {
      result.value = encoder_.encode(
          load_history(storage_, encoder_, from_height, to_height));
    }
    return result;
  }

  return fail(query_error_code::unsupported_path, "unsupported query path");
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(storage_, encoder_, from_height, to_height);
}

std::vector<event_record_t> engine::events(uint64_t from_height,
                                           uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_events(storage_, encoder_, from_height, to_height);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Strict crypto disabled; installed verifier is unused");
  }
  signature_verifier_ = std::move(verifier);
}

void engine::set_value_transfer(ledger::value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  if (!transfer) {
    spdlog::info("Restoring custodial balance transfer");
    treasury_->set_value_transfer(
        [this](const account_id_t& recipient, const amount_t& amount) {
          return credit_balance(recipient, amount);
        });
    return;
  }
  treasury_->set_value_transfer(std::move(transfer));
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

uint64_t engine::expected_nonce(const account_id_t& signer) const {
  auto found = nonces_.find(signer);
  if (found == std::end(nonces_)) {
    return 1;
  }
  return found->second;
}

bool engine::credit_balance(const account_id_t& recipient,
                            const amount_t& amount) {
  auto found = balances_.find(recipient);
  const auto current = found == std::end(balances_) ? amount_t{0}
                                                     : found->second;
  if (amount > std::numeric_limits<amount_t>::max() - current) {
    spdlog::warn("Refusing credit of {} to {}: balance would overflow",
                 amount.str(), to_hex(recipient));
    return false;
  }
  balances_[recipient] = current + amount;
  return true;
}

std::vector<storage::key_value_entry_t> engine::make_state_rows() {
  auto rows = std::vector<storage::key_value_entry_t>{};
  rows.emplace_back(make_bytes(key::kTreasuryKey),
                    encoder_.encode(treasury_->state()));

  auto depositors = std::set<account_id_t>{};
  auto beneficiaries = std::set<account_id_t>{};
  for (const auto& treasure : treasury_->treasures()) {
    rows.emplace_back(key::make_treasure_key(treasure.id),
                      encoder_.encode(treasure));
    depositors.insert(treasure.depositor);
    beneficiaries.insert(treasure.beneficiary);
  }
  for (const auto& depositor : depositors) {
    rows.emplace_back(
        key::make_depositor_index_key(depositor),
        encoder_.encode(treasury_->treasures_by_depositor(depositor)));
  }
  for (const auto& beneficiary : beneficiaries) {
    rows.emplace_back(
        key::make_beneficiary_index_key(beneficiary),
        encoder_.encode(treasury_->treasures_by_beneficiary(beneficiary)));
  }
  for (const auto& [account, balance] : balances_) {
    rows.emplace_back(key::make_balance_key(account), encoder_.encode(balance));
  }
  for (const auto& [signer, nonce] : nonces_) {
    rows.emplace_back(key::make_nonce_key(signer), encoder_.encode(nonce));
  }
  rows.emplace_back(make_bytes(key::kEventSeqKey),
                    encoder_.encode(next_event_id_));
  rows.emplace_back(make_bytes(key::kBlockTimeKey),
                    encoder_.encode(current_block_time_));
  return rows;
}

void engine::load_persisted_state(const ledger::treasury_config& config,
                                  std::string_view chain_name) {
  spdlog::debug("Loading persisted engine state");
  auto configured_chain_id = make_chain_id(chain_name);
  auto stored_chain_id =
      storage_.get<hash32_t>(encoder_, make_bytes_view(key::kChainIdKey));
  if (stored_chain_id && *stored_chain_id != configured_chain_id) {
    spdlog::error("Database chain id {} does not match '{}' ({})",
                  to_hex(*stored_chain_id), chain_name,
                  to_hex(configured_chain_id));
    common::critical("database belongs to a different chain");
  }
  chain_id_ = configured_chain_id;
  if (!stored_chain_id) {
    storage_.put(encoder_, make_bytes_view(key::kChainIdKey), chain_id_);
  }

  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;

  auto time_oracle = [this] { return current_block_time_; };
  auto value_transfer = [this](const account_id_t& recipient,
                               const amount_t& amount) {
    return credit_balance(recipient, amount);
  };

  auto state = storage_.get<treasury_state_t>(
      encoder_, make_bytes_view(key::kTreasuryKey));
  if (!state) {
    treasury_ = std::make_unique<ledger::treasury>(config, time_oracle,
                                                   value_transfer);
    spdlog::info("Initialized treasury owned by {} at {} bp ({})",
                 to_hex(treasury_->owner()), treasury_->fee_basis_points(),
                 to_string(treasury_->fee_policy()));
    storage_.commit_block(make_bytes_view(key::kStatePrefix),
                          make_state_rows(), {},
                          storage::committed_state{
                              .height = last_committed_height_,
                              .state_root = last_committed_state_root_});
    return;
  }

  auto treasures = std::vector<treasure_t>{};
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kTreasureKeyPrefix))) {
    auto treasure = encoder_.decode<treasure_t>(make_bytes_view(value));
    if (treasure.id != treasures.size()) {
      common::critical("persisted treasure table is not dense");
    }
    treasures.push_back(std::move(treasure));
  }
  if (treasures.size() != state->next_treasure_id) {
    common::critical("persisted treasure count does not match next id");
  }
  treasury_ = std::make_unique<ledger::treasury>(
      std::move(*state), std::move(treasures), time_oracle, value_transfer);

  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kBalanceKeyPrefix))) {
    auto account = key::parse_account_key(key::kBalanceKeyPrefix,
                                          make_bytes_view(row_key));
    if (!account) {
      common::critical("malformed balance key");
    }
    balances_[*account] = encoder_.decode<amount_t>(make_bytes_view(value));
  }
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kNonceKeyPrefix))) {
    auto signer =
        key::parse_account_key(key::kNonceKeyPrefix, make_bytes_view(row_key));
    if (!signer) {
      common::critical("malformed nonce key");
    }
    nonces_[*signer] = encoder_.decode<uint64_t>(make_bytes_view(value));
  }
  next_event_id_ =
      storage_.get<uint64_t>(encoder_, make_bytes_view(key::kEventSeqKey))
          .value_or(0);
  current_block_time_ =
      storage_
          .get<timestamp_seconds_t>(encoder_,
                                    make_bytes_view(key::kBlockTimeKey))
          .value_or(0);
  spdlog::info("Restored treasury with {} treasure(s) and {} account(s)",
               treasury_->treasures().size(), balances_.size());
}

}  // namespace safekeeper::execution
