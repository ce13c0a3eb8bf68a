#include <gtest/gtest.h>
#include <safekeeper/execution/signing.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>
#include <safekeeper/schema/primitives.hpp>
#include <safekeeper/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <sys/wait.h>

#ifndef SAFEKEEPER_TRANSACTION_BUILDER_PATH
#define SAFEKEEPER_TRANSACTION_BUILDER_PATH ""
#endif

using namespace safekeeper::schema;

namespace {

using encoder_t = safekeeper::schema::encoding::scale_encoder_t;

constexpr auto kSigner =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
constexpr auto kBeneficiary =
    "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

std::string builder_path() {
  return std::string{SAFEKEEPER_TRANSACTION_BUILDER_PATH};
}

std::string trim(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

/// Run the builder with `args`, returning (exit code, trimmed stdout).
std::pair<int, std::string> run_builder(const std::string_view args) {
  auto command = "'" + builder_path() + "' " + std::string{args} + " 2>/dev/null";
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, trim(output)};
  }
  return {WEXITSTATUS(status), trim(output)};
}

bytes_t run_hex_command(const std::string_view args) {
  auto [exit_code, output] = run_builder(args);
  EXPECT_EQ(exit_code, 0) << "builder failed: " << args << '\n' << output;
  auto bytes = try_from_hex(output);
  EXPECT_TRUE(bytes.has_value()) << output;
  return bytes.value_or(bytes_t{});
}

}  // namespace

class transaction_builder_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (builder_path().empty() || !std::filesystem::exists(builder_path())) {
      GTEST_SKIP() << "transaction builder binary not available: "
                   << builder_path();
    }
  }
};

TEST_F(transaction_builder_test, chain_id_matches_engine_derivation) {
  auto [exit_code, output] = run_builder("chain-id --chain-name test-chain");
  ASSERT_EQ(exit_code, 0);
  EXPECT_EQ(output, to_hex(safekeeper::execution::make_chain_id("test-chain")));
}

TEST_F(transaction_builder_test, store_transaction_decodes_to_requested_fields) {
  auto raw = run_hex_command(
      std::string{"transaction --payload store --nonce 3 --signer "} + kSigner +
      " --beneficiary " + kBeneficiary +
      " --unlock-time 1700000000 --value 1000000000000000000");

  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(make_bytes_view(raw));
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->chain_id, safekeeper::execution::make_chain_id());
  EXPECT_EQ(tx->nonce, 3u);
  EXPECT_EQ(tx->signer, make_hash32(std::string_view{kSigner}));
  auto* store = std::get_if<store_treasure_t>(&tx->payload);
  ASSERT_NE(store, nullptr);
  EXPECT_EQ(store->beneficiary, make_hash32(std::string_view{kBeneficiary}));
  EXPECT_EQ(store->unlock_time, 1700000000u);
  EXPECT_EQ(store->value, amount_t{1000000000000000000ull});
}

TEST_F(transaction_builder_test, admin_payloads_are_built) {
  auto encoder = encoder_t{};
  auto fee = encoder.decode<transaction_t>(make_bytes_view(run_hex_command(
      std::string{"tx --payload set_fee_basis_points --fee-basis-points 250 "
                  "--signer "} +
      kSigner)));
  auto* set_fee = std::get_if<set_fee_basis_points_t>(&fee.payload);
  ASSERT_NE(set_fee, nullptr);
  EXPECT_EQ(set_fee->fee_basis_points, 250u);

  auto withdraw = encoder.decode<transaction_t>(make_bytes_view(run_hex_command(
      std::string{"tx --payload withdraw_fees --signer "} + kSigner +
      " --recipient " + kBeneficiary)));
  auto* withdraw_payload = std::get_if<withdraw_fees_t>(&withdraw.payload);
  ASSERT_NE(withdraw_payload, nullptr);
  EXPECT_EQ(withdraw_payload->recipient,
            make_hash32(std::string_view{kBeneficiary}));

  auto renounce = encoder.decode<transaction_t>(make_bytes_view(run_hex_command(
      std::string{"tx --payload renounce_ownership --signer "} + kSigner)));
  EXPECT_TRUE(std::holds_alternative<renounce_ownership_t>(renounce.payload));
}

TEST_F(transaction_builder_test, signing_message_matches_library) {
  auto args = std::string{"--payload claim --treasure-id 4 --signer "} +
              kSigner + " --chain-name other-chain";
  auto encoder = encoder_t{};
  auto tx = encoder.decode<transaction_t>(
      make_bytes_view(run_hex_command("transaction " + args)));
  auto message = run_hex_command("signing-message " + args);
  EXPECT_EQ(message, safekeeper::execution::make_signing_message(tx));
}

TEST_F(transaction_builder_test, query_keys_match_route_contract) {
  auto encoder = encoder_t{};
  EXPECT_EQ(run_hex_command("query-key --path /treasure/details --treasure-id 9"),
            encoder.encode(uint64_t{9}));
  EXPECT_EQ(run_hex_command(std::string{"query-key --path /account/balance "
                                        "--account "} +
                            kSigner),
            encoder.encode(make_hash32(std::string_view{kSigner})));
  EXPECT_EQ(run_hex_command("query-key --path /events/range --from-height 2 "
                            "--to-height 5"),
            encoder.encode(std::tuple{uint64_t{2}, uint64_t{5}}));
  EXPECT_TRUE(run_hex_command("query-key --path /treasury/state").empty());
}

TEST_F(transaction_builder_test, invalid_arguments_fail) {
  EXPECT_NE(run_builder(std::string{"transaction --payload store --signer "} +
                        kSigner + " --beneficiary " + kBeneficiary +
                        " --value 12abc")
                .first,
            0);
  EXPECT_NE(run_builder("transaction --payload claim --signer 0102").first, 0);
  EXPECT_NE(run_builder("query-key --path /vault/state").first, 0);
}
