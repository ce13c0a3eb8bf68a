#pragma once

#include <safekeeper/schema/ledger_event.hpp>
#include <safekeeper/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace safekeeper::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<ledger_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace safekeeper::schema
