#pragma once

#include <safekeeper/schema/primitives.hpp>
#include <functional>

namespace safekeeper::ledger {

/// Current instant in seconds since epoch. Must never move backward.
using time_oracle_t = std::function<safekeeper::schema::timestamp_seconds_t()>;

/// Move `amount` to `recipient`. Returns false when the recipient cannot
/// accept value. Implementations may call back into the treasury.
using value_transfer_t =
    std::function<bool(const safekeeper::schema::account_id_t& recipient,
                       const safekeeper::schema::amount_t& amount)>;

}  // namespace safekeeper::ledger
