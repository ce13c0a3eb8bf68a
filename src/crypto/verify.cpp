#include <safekeeper/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace safekeeper::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_ed25519(const safekeeper::schema::bytes_view_t& message,
                    const safekeeper::schema::account_id_t& signer,
                    const safekeeper::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, signer.data(),
                                  signer.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_signature(const safekeeper::schema::bytes_view_t& message,
                      const safekeeper::schema::account_id_t& signer,
                      const safekeeper::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const safekeeper::schema::ed25519_signature_t& value) {
            return verify_ed25519(message, signer, value);
          },
          [](const safekeeper::schema::secp256k1_signature_t&) {
            return false;
          }},
      signature);
}

}  // namespace safekeeper::crypto
