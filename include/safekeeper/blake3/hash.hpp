#pragma once
#include <blake3.h>
#include <safekeeper/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace safekeeper::blake3 {

/// Incremental BLAKE3 hasher producing 32 byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  safekeeper::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

safekeeper::schema::hash32_t hash(const std::string_view& str);
safekeeper::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace safekeeper::blake3
