#pragma once

#include <safekeeper/schema/primitives.hpp>
#include <safekeeper/schema/transaction.hpp>
#include <string_view>

namespace safekeeper::execution {

inline constexpr std::string_view kDefaultChainName{"safekeeper-local-chain"};

/// Chain id bound into every transaction: blake3 of the chain name.
safekeeper::schema::hash32_t make_chain_id(
    std::string_view chain_name = kDefaultChainName);

/// Bytes covered by the transaction signature: the SCALE encoding of
/// (version, chain_id, nonce, signer, payload).
safekeeper::schema::bytes_t make_signing_message(
    const safekeeper::schema::transaction_t& tx);

}  // namespace safekeeper::execution
