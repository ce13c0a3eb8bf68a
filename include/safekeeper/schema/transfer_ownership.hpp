#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: ownership changes.
// Escrow workflow: one-step hand-over of the fee administrator role, or
// permanent removal of it.
namespace safekeeper::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  account_id_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

template <uint16_t Version>
struct renounce_ownership;

template <>
struct renounce_ownership<1> final {
  uint16_t version{1};
};

using renounce_ownership_t = renounce_ownership<1>;

}  // namespace safekeeper::schema
