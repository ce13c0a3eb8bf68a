#pragma once

#include <gtest/gtest.h>

#include <safekeeper/execution/engine.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>
#include <safekeeper/testing/common.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>
#include <vector>

namespace safekeeper::testing {

using scale_encoder_t = safekeeper::schema::encoding::scale_encoder_t;

inline safekeeper::schema::transaction_t make_transaction(
    const safekeeper::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const safekeeper::schema::account_id_t& signer,
    const safekeeper::schema::transaction_payload_t& payload) {
  return safekeeper::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = safekeeper::schema::ed25519_signature_t{}};
}

inline safekeeper::schema::bytes_t encode_transaction(
    const safekeeper::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

/// Execute one transaction in its own block and commit it.
inline safekeeper::schema::transaction_result_t finalize_single(
    safekeeper::execution::engine& engine,
    const uint64_t height,
    const safekeeper::schema::timestamp_seconds_t block_time,
    const safekeeper::schema::transaction_t& tx) {
  auto block =
      engine.finalize_block(height, block_time, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  (void)engine.commit();
  return result;
}

template <typename T>
T query_value(safekeeper::execution::engine& engine,
              const std::string_view path,
              const safekeeper::schema::bytes_t& key = {}) {
  const auto result =
      engine.query(path, safekeeper::schema::make_bytes_view(key));
  EXPECT_EQ(result.code, 0u) << path << ": " << result.log;
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(safekeeper::schema::make_bytes_view(result.value));
}

template <typename Key>
safekeeper::schema::bytes_t make_query_key(const Key& key) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(key);
}

inline safekeeper::schema::amount_t query_balance(
    safekeeper::execution::engine& engine,
    const safekeeper::schema::account_id_t& account) {
  return query_value<safekeeper::schema::amount_t>(engine, "/account/balance",
                                                   make_query_key(account));
}

inline uint64_t query_nonce(safekeeper::execution::engine& engine,
                            const safekeeper::schema::account_id_t& account) {
  return query_value<uint64_t>(engine, "/account/nonce",
                               make_query_key(account));
}

inline safekeeper::schema::treasure_t query_treasure(
    safekeeper::execution::engine& engine,
    const safekeeper::schema::treasure_id_t treasure_id) {
  return query_value<safekeeper::schema::treasure_t>(
      engine, "/treasure/details", make_query_key(treasure_id));
}

inline safekeeper::schema::treasury_state_t query_treasury_state(
    safekeeper::execution::engine& engine) {
  return query_value<safekeeper::schema::treasury_state_t>(engine,
                                                           "/treasury/state");
}

}  // namespace safekeeper::testing
