#pragma once

#include <safekeeper/ledger/collaborators.hpp>
#include <safekeeper/ledger/ledger_result.hpp>
#include <safekeeper/schema/fee_policy.hpp>
#include <safekeeper/schema/ledger_event.hpp>
#include <safekeeper/schema/primitives.hpp>
#include <safekeeper/schema/treasure.hpp>
#include <safekeeper/schema/treasury_state.hpp>
#include <map>
#include <vector>

namespace safekeeper::ledger {

/// Initial parameters for a fresh treasury.
struct treasury_config final {
  safekeeper::schema::account_id_t owner{};
  safekeeper::schema::basis_points_t fee_basis_points{42};
  safekeeper::schema::fee_policy_t fee_policy{
      safekeeper::schema::fee_policy_t::store_and_claim};
};

/// floor(value * fee_basis_points / 10000), exact for any 256-bit value.
safekeeper::schema::amount_t compute_fee(
    const safekeeper::schema::amount_t& value,
    safekeeper::schema::basis_points_t fee_basis_points);

/// Time-locked escrow ledger.
///
/// Owns every treasure record, the depositor and beneficiary index lists,
/// the fee rate, the fee pool and the owner identity. Each mutating call
/// either commits all of its effects or none of them. Record state is
/// committed before the value-transfer collaborator runs, and a reentrancy
/// guard rejects any mutating call made while another one is in progress.
///
/// Not thread-safe; callers serialize access.
class treasury final {
 public:
  treasury(const treasury_config& config,
           time_oracle_t time_oracle,
           value_transfer_t value_transfer);

  /// Rebuild a treasury from persisted state. `treasures` must be ordered by
  /// id and dense from zero; index lists are rebuilt from the records.
  treasury(safekeeper::schema::treasury_state_t state,
           std::vector<safekeeper::schema::treasure_t> treasures,
           time_oracle_t time_oracle,
           value_transfer_t value_transfer);

  treasury(const treasury&) = delete;
  treasury& operator=(const treasury&) = delete;

  /// Lock `deposited_value` for `beneficiary` until `unlock_time`.
  ///
  /// Fails with invalid_beneficiary, zero_value or unlock_time_in_past,
  /// checked in that order. On success returns the new treasure id.
  ledger_result<safekeeper::schema::treasure_id_t> store(
      const safekeeper::schema::account_id_t& depositor,
      const safekeeper::schema::account_id_t& beneficiary,
      safekeeper::schema::timestamp_seconds_t unlock_time,
      const safekeeper::schema::amount_t& deposited_value);

  /// Release an unlocked treasure to its beneficiary and return the payout.
  ///
  /// Fails with not_found, not_beneficiary, already_claimed,
  /// not_yet_unlocked or nothing_to_claim, checked in that order, and with
  /// transfer_failed when the value transfer is refused.
  ledger_result<safekeeper::schema::amount_t> claim(
      safekeeper::schema::treasure_id_t treasure_id,
      const safekeeper::schema::account_id_t& caller);

  ledger_result<safekeeper::schema::basis_points_t> set_fee_basis_points(
      const safekeeper::schema::account_id_t& caller,
      safekeeper::schema::basis_points_t fee_basis_points);

  /// Drain the fee pool to `recipient` and return the amount moved.
  ledger_result<safekeeper::schema::amount_t> withdraw_fees(
      const safekeeper::schema::account_id_t& caller,
      const safekeeper::schema::account_id_t& recipient);

  ledger_result<safekeeper::schema::account_id_t> transfer_ownership(
      const safekeeper::schema::account_id_t& caller,
      const safekeeper::schema::account_id_t& new_owner);

  /// Leave the treasury without an owner. Privileged calls fail afterwards.
  ledger_result<safekeeper::schema::account_id_t> renounce_ownership(
      const safekeeper::schema::account_id_t& caller);

  ledger_result<safekeeper::schema::treasure_t> treasure_details(
      safekeeper::schema::treasure_id_t treasure_id) const;
  std::vector<safekeeper::schema::treasure_id_t> treasures_by_depositor(
      const safekeeper::schema::account_id_t& depositor) const;
  std::vector<safekeeper::schema::treasure_id_t> treasures_by_beneficiary(
      const safekeeper::schema::account_id_t& beneficiary) const;

  safekeeper::schema::treasure_id_t next_treasure_id() const;
  safekeeper::schema::basis_points_t fee_basis_points() const;
  const safekeeper::schema::amount_t& collected_fees() const;
  const safekeeper::schema::account_id_t& owner() const;
  safekeeper::schema::fee_policy_t fee_policy() const;

  const safekeeper::schema::treasury_state_t& state() const;
  const std::vector<safekeeper::schema::treasure_t>& treasures() const;

  void set_time_oracle(time_oracle_t time_oracle);
  void set_value_transfer(value_transfer_t value_transfer);

 private:
  using index_t = std::map<safekeeper::schema::account_id_t,
                           std::vector<safekeeper::schema::treasure_id_t>>;

  bool is_owner(const safekeeper::schema::account_id_t& caller) const;
  bool transfer(const safekeeper::schema::account_id_t& recipient,
                const safekeeper::schema::amount_t& amount);
  bool fee_pool_can_absorb(const safekeeper::schema::amount_t& fee) const;

  safekeeper::schema::treasury_state_t state_;
  std::vector<safekeeper::schema::treasure_t> treasures_;
  index_t by_depositor_;
  index_t by_beneficiary_;
  time_oracle_t time_oracle_;
  value_transfer_t value_transfer_;
  bool entered_{false};
};

}  // namespace safekeeper::ledger
