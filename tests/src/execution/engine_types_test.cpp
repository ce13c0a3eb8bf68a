#include <gtest/gtest.h>
#include <safekeeper/execution/engine.hpp>
#include <safekeeper/testing/ed25519_signer.hpp>
#include <safekeeper/testing/execution_fixture.hpp>

using namespace safekeeper::schema;
using safekeeper::execution::make_chain_id;
using safekeeper::execution::make_signing_message;
using safekeeper::testing::ed25519_signer;
using safekeeper::testing::encode_transaction;
using safekeeper::testing::execution_fixture;
using safekeeper::testing::make_account;
using safekeeper::testing::make_transaction;

TEST(engine_types, defaults_are_stable) {
  auto tx = transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.data.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());
  EXPECT_EQ(block.state_root, hash32_t{});

  auto commit = commit_result_t{};
  EXPECT_EQ(commit.committed_height, 0);

  auto info = app_info_t{};
  EXPECT_EQ(info.data, "safekeeper-escrow");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.last_block_height, 0);
}

TEST(engine_types, chain_id_is_bound_to_chain_name) {
  EXPECT_EQ(make_chain_id(), make_chain_id("safekeeper-local-chain"));
  EXPECT_NE(make_chain_id("chain-a"), make_chain_id("chain-b"));
  EXPECT_NE(make_chain_id("chain-a"), hash32_t{});
}

TEST(engine_types, signing_message_excludes_signature) {
  auto tx = make_transaction(make_chain_id(), 1, make_account(2),
                             claim_treasure_t{.treasure_id = 3});
  auto unsigned_message = make_signing_message(tx);
  auto signed_tx = tx;
  signed_tx.signature = ed25519_signature_t{0xAA};
  EXPECT_EQ(make_signing_message(signed_tx), unsigned_message);

  auto next = tx;
  next.nonce = 2;
  EXPECT_NE(make_signing_message(next), unsigned_message);
}

TEST(engine_types, strict_crypto_requires_valid_signature) {
  auto signer = ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  auto fixture = execution_fixture{"safekeeper_engine_strict", {}, true};
  auto& engine = fixture.engine();

  auto tx = make_transaction(
      fixture.chain_id(), 1, signer->account(),
      store_treasure_t{.beneficiary = make_account(3),
                       .unlock_time = 5000,
                       .value = amount_t{1000}});
  auto unsigned_result =
      engine.check_transaction(make_bytes_view(encode_transaction(tx)));
  EXPECT_EQ(unsigned_result.code,
            to_code(ledger_error_code::signature_verification_failed));

  auto message = make_signing_message(tx);
  auto signature = signer->sign(make_bytes_view(message));
  ASSERT_TRUE(signature.has_value());
  tx.signature = *signature;
  auto raw = encode_transaction(tx);
  EXPECT_EQ(engine.check_transaction(make_bytes_view(raw)).code, 0u);

  auto block = engine.finalize_block(1, 1000, {raw});
  ASSERT_EQ(block.tx_results.size(), 1u);
  EXPECT_EQ(block.tx_results[0].code, 0u) << block.tx_results[0].log;
}

TEST(engine_types, installed_verifier_applies_only_in_strict_mode) {
  auto calls = 0;
  auto verifier = safekeeper::execution::signature_verifier_t{
      [&calls](const bytes_view_t&, const account_id_t& signer,
               const signature_t&) {
        ++calls;
        return signer == make_account(2);
      }};

  auto relaxed = execution_fixture{"safekeeper_engine_relaxed"};
  relaxed.engine().set_signature_verifier(verifier);
  auto relaxed_tx = make_transaction(relaxed.chain_id(), 1, make_account(9),
                                     renounce_ownership_t{});
  EXPECT_EQ(relaxed.engine()
                .check_transaction(
                    make_bytes_view(encode_transaction(relaxed_tx)))
                .code,
            0u);
  EXPECT_EQ(calls, 0);

  auto strict = execution_fixture{"safekeeper_engine_custom", {}, true};
  strict.engine().set_signature_verifier(verifier);
  auto allowed = make_transaction(strict.chain_id(), 1, make_account(2),
                                  renounce_ownership_t{});
  auto denied = make_transaction(strict.chain_id(), 1, make_account(9),
                                 renounce_ownership_t{});
  EXPECT_EQ(strict.engine()
                .check_transaction(make_bytes_view(encode_transaction(allowed)))
                .code,
            0u);
  EXPECT_EQ(strict.engine()
                .check_transaction(make_bytes_view(encode_transaction(denied)))
                .code,
            to_code(ledger_error_code::signature_verification_failed));
  EXPECT_EQ(calls, 2);
}
