#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: treasure.
// Escrow workflow: one time-locked escrow record. `amount` is the remaining
// claimable value after the store fee and drops to zero once claimed.
namespace safekeeper::schema {

template <uint16_t Version>
struct treasure;

template <>
struct treasure<1> final {
  uint16_t version{1};
  treasure_id_t id{};
  amount_t amount{};
  timestamp_seconds_t unlock_time{};
  bool claimed{};
  account_id_t depositor{};
  account_id_t beneficiary{};
};

using treasure_t = treasure<1>;

}  // namespace safekeeper::schema
