#pragma once

#include <cstdint>

// Schema type: query error code.
// Escrow workflow: read-path failure codes for the query router.
namespace safekeeper::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace safekeeper::schema
