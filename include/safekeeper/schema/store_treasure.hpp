#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: store treasure.
// Escrow workflow: depositor locks `value` for `beneficiary` until
// `unlock_time`. The signer of the enclosing transaction is the depositor.
namespace safekeeper::schema {

template <uint16_t Version>
struct store_treasure;

template <>
struct store_treasure<1> final {
  uint16_t version{1};
  account_id_t beneficiary{};
  timestamp_seconds_t unlock_time{};
  amount_t value{};
};

using store_treasure_t = store_treasure<1>;

}  // namespace safekeeper::schema
