#pragma once

#include <safekeeper/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: fee policy.
// Escrow workflow: selects whether the fee rate is charged once on store or
// again on the escrowed amount at claim time.
namespace safekeeper::schema {

enum class fee_policy_t : uint8_t {
  store_and_claim = 0,
  store_only = 1,
};

inline constexpr auto kFeePolicyMappings =
    enum_mappings_t<fee_policy_t, 2>{
        std::pair{std::string_view{"store_and_claim"},
                  fee_policy_t::store_and_claim},
        std::pair{std::string_view{"store_only"}, fee_policy_t::store_only}};

template <>
inline std::optional<fee_policy_t> try_from_string<fee_policy_t>(
    const std::string_view value) {
  return from_string(value, kFeePolicyMappings);
}

inline constexpr std::string_view to_string(const fee_policy_t value) {
  return to_string(value, kFeePolicyMappings).value_or("unknown");
}

}  // namespace safekeeper::schema
