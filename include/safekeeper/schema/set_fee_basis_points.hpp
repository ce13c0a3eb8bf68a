#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: set fee basis points.
// Escrow workflow: owner-only update of the fee rate (0..10000).
namespace safekeeper::schema {

template <uint16_t Version>
struct set_fee_basis_points;

template <>
struct set_fee_basis_points<1> final {
  uint16_t version{1};
  basis_points_t fee_basis_points{};
};

using set_fee_basis_points_t = set_fee_basis_points<1>;

}  // namespace safekeeper::schema
