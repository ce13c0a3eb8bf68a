#include <safekeeper/blake3/hash.hpp>
#include <safekeeper/execution/signing.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace safekeeper::execution {

safekeeper::schema::hash32_t make_chain_id(std::string_view chain_name) {
  return safekeeper::blake3::hash(chain_name);
}

safekeeper::schema::bytes_t make_signing_message(
    const safekeeper::schema::transaction_t& tx) {
  auto encoder = safekeeper::schema::encoding::scale_encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace safekeeper::execution
