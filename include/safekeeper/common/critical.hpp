#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace safekeeper::common {

/// Log, flush every sink and terminate. Reserved for corrupted storage and
/// codec failures the ledger cannot continue past.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace safekeeper::common
