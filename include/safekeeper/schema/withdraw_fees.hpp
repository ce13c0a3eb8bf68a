#pragma once
#include <safekeeper/schema/primitives.hpp>

// Schema type: withdraw fees.
// Escrow workflow: owner drains the whole fee pool to `recipient`.
namespace safekeeper::schema {

template <uint16_t Version>
struct withdraw_fees;

template <>
struct withdraw_fees<1> final {
  uint16_t version{1};
  account_id_t recipient{};
};

using withdraw_fees_t = withdraw_fees<1>;

}  // namespace safekeeper::schema
