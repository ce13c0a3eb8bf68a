#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: claim treasure.
// Escrow workflow: beneficiary releases an unlocked treasure to itself.
namespace safekeeper::schema {

template <uint16_t Version>
struct claim_treasure;

template <>
struct claim_treasure<1> final {
  uint16_t version{1};
  treasure_id_t treasure_id{};
};

using claim_treasure_t = claim_treasure<1>;

}  // namespace safekeeper::schema
