#pragma once
#include <safekeeper/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const store_treasure<1>& o, ::scale::Encoder& encoder);
void decode(store_treasure<1>& o, ::scale::Decoder& decoder);

void encode(const claim_treasure<1>& o, ::scale::Encoder& encoder);
void decode(claim_treasure<1>& o, ::scale::Decoder& decoder);

void encode(const set_fee_basis_points<1>& o, ::scale::Encoder& encoder);
void decode(set_fee_basis_points<1>& o, ::scale::Decoder& decoder);

void encode(const withdraw_fees<1>& o, ::scale::Encoder& encoder);
void decode(withdraw_fees<1>& o, ::scale::Decoder& decoder);

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const renounce_ownership<1>& o, ::scale::Encoder& encoder);
void decode(renounce_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
