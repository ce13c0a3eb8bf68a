#pragma once

#include <safekeeper/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: ledger error code.
// Escrow workflow: stable numeric codes returned by ledger operations and
// surfaced as transaction result codes. Zero is success.
namespace safekeeper::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signer = 5,
  signature_verification_failed = 6,
  invalid_beneficiary = 10,
  zero_value = 11,
  unlock_time_in_past = 12,
  not_found = 13,
  not_beneficiary = 14,
  already_claimed = 15,
  not_yet_unlocked = 16,
  nothing_to_claim = 17,
  unauthorized = 18,
  fee_too_high = 19,
  invalid_recipient = 20,
  invalid_owner = 21,
  transfer_failed = 22,
  reentrant_call = 23,
  arithmetic_overflow = 24,
};

inline constexpr auto kLedgerErrorCodeMappings =
    enum_mappings_t<ledger_error_code, 22>{
        std::pair{std::string_view{"ok"}, ledger_error_code::ok},
        std::pair{std::string_view{"invalid_transaction"},
                  ledger_error_code::invalid_transaction},
        std::pair{std::string_view{"unsupported_transaction_version"},
                  ledger_error_code::unsupported_transaction_version},
        std::pair{std::string_view{"invalid_chain_id"},
                  ledger_error_code::invalid_chain_id},
        std::pair{std::string_view{"invalid_nonce"},
                  ledger_error_code::invalid_nonce},
        std::pair{std::string_view{"invalid_signer"},
                  ledger_error_code::invalid_signer},
        std::pair{std::string_view{"signature_verification_failed"},
                  ledger_error_code::signature_verification_failed},
        std::pair{std::string_view{"invalid_beneficiary"},
                  ledger_error_code::invalid_beneficiary},
        std::pair{std::string_view{"zero_value"},
                  ledger_error_code::zero_value},
        std::pair{std::string_view{"unlock_time_in_past"},
                  ledger_error_code::unlock_time_in_past},
        std::pair{std::string_view{"not_found"}, ledger_error_code::not_found},
        std::pair{std::string_view{"not_beneficiary"},
                  ledger_error_code::not_beneficiary},
        std::pair{std::string_view{"already_claimed"},
                  ledger_error_code::already_claimed},
        std::pair{std::string_view{"not_yet_unlocked"},
                  ledger_error_code::not_yet_unlocked},
        std::pair{std::string_view{"nothing_to_claim"},
                  ledger_error_code::nothing_to_claim},
        std::pair{std::string_view{"unauthorized"},
                  ledger_error_code::unauthorized},
        std::pair{std::string_view{"fee_too_high"},
                  ledger_error_code::fee_too_high},
        std::pair{std::string_view{"invalid_recipient"},
                  ledger_error_code::invalid_recipient},
        std::pair{std::string_view{"invalid_owner"},
                  ledger_error_code::invalid_owner},
        std::pair{std::string_view{"transfer_failed"},
                  ledger_error_code::transfer_failed},
        std::pair{std::string_view{"reentrant_call"},
                  ledger_error_code::reentrant_call},
        std::pair{std::string_view{"arithmetic_overflow"},
                  ledger_error_code::arithmetic_overflow}};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const ledger_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace safekeeper::schema
