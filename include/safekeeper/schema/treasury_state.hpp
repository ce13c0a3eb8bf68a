#pragma once
#include <safekeeper/schema/fee_policy.hpp>
#include <safekeeper/schema/primitives.hpp>

// Schema type: treasury state.
// Escrow workflow: global ledger parameters and counters persisted alongside
// the treasure table.
namespace safekeeper::schema {

template <uint16_t Version>
struct treasury_state;

template <>
struct treasury_state<1> final {
  uint16_t version{1};
  treasure_id_t next_treasure_id{};
  basis_points_t fee_basis_points{42};
  amount_t collected_fees{};
  account_id_t owner{};
  fee_policy_t fee_policy{fee_policy_t::store_and_claim};
};

using treasury_state_t = treasury_state<1>;

}  // namespace safekeeper::schema
