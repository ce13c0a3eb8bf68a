#pragma once

#include <safekeeper/schema/ledger_error_code.hpp>
#include <safekeeper/schema/ledger_event.hpp>
#include <optional>
#include <vector>

namespace safekeeper::ledger {

/// Outcome of one ledger operation. `value` is set only on success and
/// `events` lists what the operation emitted, in order.
template <typename T>
struct ledger_result final {
  safekeeper::schema::ledger_error_code code{
      safekeeper::schema::ledger_error_code::ok};
  std::optional<T> value;
  std::vector<safekeeper::schema::ledger_event_t> events;

  bool ok() const { return code == safekeeper::schema::ledger_error_code::ok; }
};

template <typename T>
ledger_result<T> make_error(const safekeeper::schema::ledger_error_code code) {
  return ledger_result<T>{.code = code, .value = std::nullopt, .events = {}};
}

}  // namespace safekeeper::ledger
