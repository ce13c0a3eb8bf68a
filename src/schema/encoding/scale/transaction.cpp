#include <safekeeper/schema/encoding/scale/transaction.hpp>

using namespace safekeeper::schema;

namespace safekeeper::schema::encoding::scale {

void encode(const store_treasure<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.beneficiary, encoder);
  encode(o.unlock_time, encoder);
  encode(o.value, encoder);
}

void decode(store_treasure<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.beneficiary, decoder);
  decode(o.unlock_time, decoder);
  decode(o.value, decoder);
}

void encode(const claim_treasure<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.treasure_id, encoder);
}

void decode(claim_treasure<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.treasure_id, decoder);
}

void encode(const set_fee_basis_points<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fee_basis_points, encoder);
}

void decode(set_fee_basis_points<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fee_basis_points, decoder);
}

void encode(const withdraw_fees<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient, encoder);
}

void decode(withdraw_fees<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient, decoder);
}

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

void encode(const renounce_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(renounce_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace safekeeper::schema::encoding::scale
