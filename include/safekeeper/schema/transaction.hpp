#pragma once
#include <safekeeper/schema/claim_treasure.hpp>
#include <safekeeper/schema/primitives.hpp>
#include <safekeeper/schema/set_fee_basis_points.hpp>
#include <safekeeper/schema/store_treasure.hpp>
#include <safekeeper/schema/transfer_ownership.hpp>
#include <safekeeper/schema/withdraw_fees.hpp>
#include <variant>

namespace safekeeper::schema {

using transaction_payload_t = std::variant<store_treasure_t,
                                           claim_treasure_t,
                                           set_fee_basis_points_t,
                                           withdraw_fees_t,
                                           transfer_ownership_t,
                                           renounce_ownership_t>;

template <uint16_t Version>
struct transaction;

/// Signed envelope. `signer` is the caller identity for the payload.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace safekeeper::schema
