#include <gtest/gtest.h>
#include <safekeeper/crypto/verify.hpp>
#include <safekeeper/testing/ed25519_signer.hpp>

#include <string_view>

using safekeeper::schema::bytes_t;
using safekeeper::schema::make_bytes;
using safekeeper::schema::make_bytes_view;
using safekeeper::testing::ed25519_signer;

namespace {

const auto kMessage = make_bytes(std::string_view{"store 1 coin until 2000"});

}  // namespace

TEST(crypto_verify, openssl_provides_ed25519) {
  EXPECT_TRUE(safekeeper::crypto::available());
}

TEST(crypto_verify, accepts_valid_ed25519_signature) {
  auto signer = ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  auto signature = signer->sign(make_bytes_view(kMessage));
  ASSERT_TRUE(signature.has_value());

  EXPECT_TRUE(safekeeper::crypto::verify_signature(
      make_bytes_view(kMessage), signer->account(),
      safekeeper::schema::signature_t{*signature}));
}

TEST(crypto_verify, rejects_tampered_message_and_signature) {
  auto signer = ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  auto signature = signer->sign(make_bytes_view(kMessage));
  ASSERT_TRUE(signature.has_value());

  auto altered = kMessage;
  altered.back() ^= 0x01;
  EXPECT_FALSE(safekeeper::crypto::verify_signature(
      make_bytes_view(altered), signer->account(),
      safekeeper::schema::signature_t{*signature}));

  auto corrupted = *signature;
  corrupted[0] ^= 0x80;
  EXPECT_FALSE(safekeeper::crypto::verify_signature(
      make_bytes_view(kMessage), signer->account(),
      safekeeper::schema::signature_t{corrupted}));
}

TEST(crypto_verify, rejects_signature_from_other_account) {
  auto alice = ed25519_signer::generate();
  auto bob = ed25519_signer::generate();
  ASSERT_TRUE(alice.has_value());
  ASSERT_TRUE(bob.has_value());
  auto signature = alice->sign(make_bytes_view(kMessage));
  ASSERT_TRUE(signature.has_value());

  EXPECT_FALSE(safekeeper::crypto::verify_signature(
      make_bytes_view(kMessage), bob->account(),
      safekeeper::schema::signature_t{*signature}));
}

TEST(crypto_verify, secp256k1_signatures_never_verify) {
  auto signer = ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  EXPECT_FALSE(safekeeper::crypto::verify_signature(
      make_bytes_view(kMessage), signer->account(),
      safekeeper::schema::signature_t{
          safekeeper::schema::secp256k1_signature_t{}}));
}
