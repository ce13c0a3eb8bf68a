#include <safekeeper/ledger/reentrancy_guard.hpp>
#include <safekeeper/ledger/treasury.hpp>
#include <spdlog/spdlog.h>

#include <limits>
#include <utility>

using namespace safekeeper::schema;

namespace safekeeper::ledger {

amount_t compute_fee(const amount_t& value, basis_points_t fee_basis_points) {
  auto product = boost::multiprecision::uint512_t{value} * fee_basis_points;
  return amount_t{product / kMaxBasisPoints};
}

treasury::treasury(const treasury_config& config,
                   time_oracle_t time_oracle,
                   value_transfer_t value_transfer)
    : time_oracle_{std::move(time_oracle)},
      value_transfer_{std::move(value_transfer)} {
  state_.owner = config.owner;
  state_.fee_basis_points = config.fee_basis_points;
  state_.fee_policy = config.fee_policy;
  if (state_.fee_basis_points > kMaxBasisPoints) {
    spdlog::warn("Configured fee {} bp exceeds 100%; clamping to {}",
                 state_.fee_basis_points, kMaxBasisPoints);
    state_.fee_basis_points = kMaxBasisPoints;
  }
  if (is_null_account(state_.owner)) {
    spdlog::warn("Treasury created without an owner; fee pool is locked");
  }
}

treasury::treasury(treasury_state_t state,
                   std::vector<treasure_t> treasures,
                   time_oracle_t time_oracle,
                   value_transfer_t value_transfer)
    : state_{std::move(state)},
      treasures_{std::move(treasures)},
      time_oracle_{std::move(time_oracle)},
      value_transfer_{std::move(value_transfer)} {
  for (const auto& treasure : treasures_) {
    by_depositor_[treasure.depositor].push_back(treasure.id);
    by_beneficiary_[treasure.beneficiary].push_back(treasure.id);
  }
}

ledger_result<treasure_id_t> treasury::store(
    const account_id_t& depositor,
    const account_id_t& beneficiary,
    timestamp_seconds_t unlock_time,
    const amount_t& deposited_value) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<treasure_id_t>(ledger_error_code::reentrant_call);
  }
  if (is_null_account(beneficiary)) {
    return make_error<treasure_id_t>(ledger_error_code::invalid_beneficiary);
  }
  if (deposited_value == 0) {
    return make_error<treasure_id_t>(ledger_error_code::zero_value);
  }
  if (unlock_time <= time_oracle_()) {
    return make_error<treasure_id_t>(ledger_error_code::unlock_time_in_past);
  }

  const auto fee = compute_fee(deposited_value, state_.fee_basis_points);
  if (!fee_pool_can_absorb(fee)) {
    spdlog::warn("Store rejected: fee {} would overflow the fee pool",
                 fee.str());
    return make_error<treasure_id_t>(ledger_error_code::arithmetic_overflow);
  }
  const auto net_amount = deposited_value - fee;
  const auto id = state_.next_treasure_id;

  state_.collected_fees += fee;
  ++state_.next_treasure_id;
  treasures_.push_back(treasure_t{.id = id,
                                  .amount = net_amount,
                                  .unlock_time = unlock_time,
                                  .claimed = false,
                                  .depositor = depositor,
                                  .beneficiary = beneficiary});
  by_depositor_[depositor].push_back(id);
  by_beneficiary_[beneficiary].push_back(id);

  auto result = ledger_result<treasure_id_t>{.value = id};
  result.events.push_back(treasure_stored_t{.depositor = depositor,
                                            .beneficiary = beneficiary,
                                            .amount = net_amount,
                                            .unlock_time = unlock_time,
                                            .treasure_id = id});
  spdlog::debug("Stored treasure {} unlocking at {} (fee {})", id,
                unlock_time, fee.str());
  return result;
}

ledger_result<amount_t> treasury::claim(treasure_id_t treasure_id,
                                        const account_id_t& caller) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<amount_t>(ledger_error_code::reentrant_call);
  }
  if (treasure_id >= treasures_.size()) {
    return make_error<amount_t>(ledger_error_code::not_found);
  }
  const auto previous = treasures_[treasure_id];
  if (previous.beneficiary != caller) {
    return make_error<amount_t>(ledger_error_code::not_beneficiary);
  }
  if (previous.claimed) {
    return make_error<amount_t>(ledger_error_code::already_claimed);
  }
  if (time_oracle_() < previous.unlock_time) {
    return make_error<amount_t>(ledger_error_code::not_yet_unlocked);
  }
  if (previous.amount == 0) {
    return make_error<amount_t>(ledger_error_code::nothing_to_claim);
  }

  const auto claim_fee =
      state_.fee_policy == fee_policy_t::store_and_claim
          ? compute_fee(previous.amount, state_.fee_basis_points)
          : amount_t{0};
  if (!fee_pool_can_absorb(claim_fee)) {
    spdlog::warn("Claim of treasure {} rejected: fee {} would overflow the "
                 "fee pool",
                 treasure_id, claim_fee.str());
    return make_error<amount_t>(ledger_error_code::arithmetic_overflow);
  }
  const auto payout = previous.amount - claim_fee;
  const auto previous_fees = state_.collected_fees;

  state_.collected_fees += claim_fee;
  treasures_[treasure_id].claimed = true;
  treasures_[treasure_id].amount = 0;

  auto rollback = [&] {
    treasures_[treasure_id] = previous;
    state_.collected_fees = previous_fees;
  };

  auto transferred = false;
  try {
    transferred = transfer(caller, payout);
  } catch (const std::exception& ex) {
    spdlog::error("Value transfer for treasure {} threw: {}", treasure_id,
                  ex.what());
    rollback();
    throw;
  }
  if (!transferred) {
    rollback();
    spdlog::warn("Value transfer for treasure {} refused; claim rolled back",
                 treasure_id);
    return make_error<amount_t>(ledger_error_code::transfer_failed);
  }

  auto result = ledger_result<amount_t>{.value = payout};
  result.events.push_back(treasure_claimed_t{.beneficiary = caller,
                                             .amount = payout,
                                             .treasure_id = treasure_id});
  spdlog::debug("Claimed treasure {} (payout {}, fee {})", treasure_id,
                payout.str(), claim_fee.str());
  return result;
}

ledger_result<basis_points_t> treasury::set_fee_basis_points(
    const account_id_t& caller,
    basis_points_t fee_basis_points) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<basis_points_t>(ledger_error_code::reentrant_call);
  }
  if (!is_owner(caller)) {
    return make_error<basis_points_t>(ledger_error_code::unauthorized);
  }
  if (fee_basis_points > kMaxBasisPoints) {
    return make_error<basis_points_t>(ledger_error_code::fee_too_high);
  }

  state_.fee_basis_points = fee_basis_points;
  auto result = ledger_result<basis_points_t>{.value = fee_basis_points};
  result.events.push_back(
      fee_updated_t{.fee_basis_points = fee_basis_points});
  spdlog::info("Fee rate set to {} bp", fee_basis_points);
  return result;
}

ledger_result<amount_t> treasury::withdraw_fees(const account_id_t& caller,
                                                const account_id_t& recipient) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<amount_t>(ledger_error_code::reentrant_call);
  }
  if (!is_owner(caller)) {
    return make_error<amount_t>(ledger_error_code::unauthorized);
  }
  if (is_null_account(recipient)) {
    return make_error<amount_t>(ledger_error_code::invalid_recipient);
  }

  const auto amount = state_.collected_fees;
  state_.collected_fees = 0;

  auto transferred = false;
  try {
    transferred = transfer(recipient, amount);
  } catch (const std::exception& ex) {
    spdlog::error("Fee withdrawal transfer threw: {}", ex.what());
    state_.collected_fees = amount;
    throw;
  }
  if (!transferred) {
    state_.collected_fees = amount;
    spdlog::warn("Fee withdrawal of {} refused; pool restored", amount.str());
    return make_error<amount_t>(ledger_error_code::transfer_failed);
  }

  auto result = ledger_result<amount_t>{.value = amount};
  result.events.push_back(
      fees_withdrawn_t{.recipient = recipient, .amount = amount});
  spdlog::info("Withdrew {} in fees to {}", amount.str(), to_hex(recipient));
  return result;
}

ledger_result<account_id_t> treasury::transfer_ownership(
    const account_id_t& caller,
    const account_id_t& new_owner) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<account_id_t>(ledger_error_code::reentrant_call);
  }
  if (!is_owner(caller)) {
    return make_error<account_id_t>(ledger_error_code::unauthorized);
  }
  if (is_null_account(new_owner)) {
    return make_error<account_id_t>(ledger_error_code::invalid_owner);
  }

  const auto previous_owner = state_.owner;
  state_.owner = new_owner;
  auto result = ledger_result<account_id_t>{.value = new_owner};
  result.events.push_back(ownership_transferred_t{
      .previous_owner = previous_owner, .new_owner = new_owner});
  spdlog::info("Ownership transferred to {}", to_hex(new_owner));
  return result;
}

ledger_result<account_id_t> treasury::renounce_ownership(
    const account_id_t& caller) {
  auto guard = reentrancy_guard{entered_};
  if (!guard.acquired()) {
    return make_error<account_id_t>(ledger_error_code::reentrant_call);
  }
  if (!is_owner(caller)) {
    return make_error<account_id_t>(ledger_error_code::unauthorized);
  }

  const auto previous_owner = state_.owner;
  state_.owner = make_zero_hash();
  auto result = ledger_result<account_id_t>{.value = state_.owner};
  result.events.push_back(ownership_transferred_t{
      .previous_owner = previous_owner, .new_owner = state_.owner});
  spdlog::warn("Ownership renounced by {}", to_hex(previous_owner));
  return result;
}

ledger_result<treasure_t> treasury::treasure_details(
    treasure_id_t treasure_id) const {
  if (treasure_id >= treasures_.size()) {
    return make_error<treasure_t>(ledger_error_code::not_found);
  }
  return ledger_result<treasure_t>{.value = treasures_[treasure_id]};
}

std::vector<treasure_id_t> treasury::treasures_by_depositor(
    const account_id_t& depositor) const {
  auto found = by_depositor_.find(depositor);
  if (found == std::end(by_depositor_)) {
    return {};
  }
  return found->second;
}

std::vector<treasure_id_t> treasury::treasures_by_beneficiary(
    const account_id_t& beneficiary) const {
  auto found = by_beneficiary_.find(beneficiary);
  if (found == std::end(by_beneficiary_)) {
    return {};
  }
  return found->second;
}

treasure_id_t treasury::next_treasure_id() const {
  return state_.next_treasure_id;
}

basis_points_t treasury::fee_basis_points() const {
  return state_.fee_basis_points;
}

const amount_t& treasury::collected_fees() const {
  return state_.collected_fees;
}

const account_id_t& treasury::owner() const {
  return state_.owner;
}

fee_policy_t treasury::fee_policy() const {
  return state_.fee_policy;
}

const treasury_state_t& treasury::state() const {
  return state_;
}

const std::vector<treasure_t>& treasury::treasures() const {
  return treasures_;
}

void treasury::set_time_oracle(time_oracle_t time_oracle) {
  time_oracle_ = std::move(time_oracle);
}

void treasury::set_value_transfer(value_transfer_t value_transfer) {
  value_transfer_ = std::move(value_transfer);
}

bool treasury::is_owner(const account_id_t& caller) const {
  return !is_null_account(state_.owner) && caller == state_.owner;
}

bool treasury::transfer(const account_id_t& recipient, const amount_t& amount) {
  if (!value_transfer_) {
    spdlog::error("No value transfer installed; refusing payout of {}",
                  amount.str());
    return false;
  }
  return value_transfer_(recipient, amount);
}

bool treasury::fee_pool_can_absorb(const amount_t& fee) const {
  return fee <= std::numeric_limits<amount_t>::max() - state_.collected_fees;
}

}  // namespace safekeeper::ledger
