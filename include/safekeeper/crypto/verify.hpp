#pragma once

#include <safekeeper/schema/primitives.hpp>

namespace safekeeper::crypto {

/// True when the linked OpenSSL provides Ed25519.
bool available();

/// Verify `signature` over `message` for `signer`.
///
/// Account ids are raw Ed25519 public keys, so only Ed25519 signatures can
/// verify; a secp256k1 signature is always rejected.
bool verify_signature(const safekeeper::schema::bytes_view_t& message,
                      const safekeeper::schema::account_id_t& signer,
                      const safekeeper::schema::signature_t& signature);

}  // namespace safekeeper::crypto
