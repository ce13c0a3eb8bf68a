#include <gtest/gtest.h>
#include <safekeeper/schema/fee_policy.hpp>
#include <safekeeper/schema/ledger_error_code.hpp>
#include <safekeeper/schema/ledger_event.hpp>
#include <safekeeper/schema/primitives.hpp>

#include <limits>

using namespace safekeeper::schema;

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(to_hex(hash),
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(try_make_hash32(std::string(63, 'a')).has_value());
  EXPECT_TRUE(try_make_hash32(std::string(64, 'A')).has_value());
}

TEST(primitives, hex_accepts_prefix_and_mixed_case) {
  auto decoded = try_from_hex("0XaBcD");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (bytes_t{0xAB, 0xCD}));
  EXPECT_FALSE(try_from_hex("abc").has_value());
  EXPECT_EQ(try_from_hex("")->size(), 0u);
}

TEST(primitives, null_account_is_all_zero) {
  EXPECT_TRUE(is_null_account(account_id_t{}));
  EXPECT_TRUE(is_null_account(make_zero_hash()));
  auto account = account_id_t{};
  account[31] = 1;
  EXPECT_FALSE(is_null_account(account));
}

TEST(primitives, try_make_amount_parses_full_uint256_range) {
  EXPECT_EQ(try_make_amount("0").value(), amount_t{0});
  EXPECT_EQ(try_make_amount("1000000000000000000").value(),
            amount_t{1000000000000000000ull});
  auto max = try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935");
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, std::numeric_limits<amount_t>::max());
}

TEST(primitives, try_make_amount_rejects_overflow_and_junk) {
  EXPECT_FALSE(try_make_amount(
                   "115792089237316195423570985008687907853269984665640564039"
                   "457584007913129639936")
                   .has_value());
  EXPECT_FALSE(try_make_amount("").has_value());
  EXPECT_FALSE(try_make_amount("-1").has_value());
  EXPECT_FALSE(try_make_amount("1e18").has_value());
  EXPECT_FALSE(try_make_amount(std::string(79, '1')).has_value());
}

TEST(primitives, fee_policy_names_round_trip) {
  EXPECT_EQ(to_string(fee_policy_t::store_only), "store_only");
  EXPECT_EQ(try_from_string<fee_policy_t>("store_and_claim").value(),
            fee_policy_t::store_and_claim);
  EXPECT_FALSE(try_from_string<fee_policy_t>("claim_only").has_value());
}

TEST(primitives, ledger_error_codes_are_stable) {
  EXPECT_EQ(to_code(ledger_error_code::ok), 0u);
  EXPECT_EQ(to_code(ledger_error_code::invalid_nonce), 4u);
  EXPECT_EQ(to_code(ledger_error_code::invalid_beneficiary), 10u);
  EXPECT_EQ(to_code(ledger_error_code::reentrant_call), 23u);
  EXPECT_EQ(to_code(ledger_error_code::arithmetic_overflow), 24u);
  EXPECT_EQ(to_string(ledger_error_code::arithmetic_overflow),
            "arithmetic_overflow");
  EXPECT_EQ(to_string(ledger_error_code::not_yet_unlocked), "not_yet_unlocked");
  EXPECT_EQ(to_string(ledger_error_code::fee_too_high), "fee_too_high");
}

TEST(primitives, event_types_name_each_variant) {
  EXPECT_EQ(event_type(ledger_event_t{treasure_stored_t{}}), "stored");
  EXPECT_EQ(event_type(ledger_event_t{treasure_claimed_t{}}), "claimed");
  EXPECT_EQ(event_type(ledger_event_t{fee_updated_t{}}), "fee_updated");
  EXPECT_EQ(event_type(ledger_event_t{fees_withdrawn_t{}}), "fees_withdrawn");
  EXPECT_EQ(event_type(ledger_event_t{ownership_transferred_t{}}),
            "ownership_transferred");
}
