#pragma once

#include <safekeeper/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace safekeeper::testing {

inline safekeeper::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = safekeeper::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline safekeeper::schema::account_id_t make_account(const uint8_t seed) {
  return make_hash(seed);
}

/// 10^18, the smallest-unit count of one whole coin.
inline safekeeper::schema::amount_t one_coin() {
  return safekeeper::schema::amount_t{1000000000000000000ull};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace safekeeper::testing
