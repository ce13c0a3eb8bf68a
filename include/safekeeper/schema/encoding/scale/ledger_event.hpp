#pragma once
#include <safekeeper/schema/ledger_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const treasure_stored_t& o, ::scale::Encoder& encoder);
void decode(treasure_stored_t& o, ::scale::Decoder& decoder);

void encode(const treasure_claimed_t& o, ::scale::Encoder& encoder);
void decode(treasure_claimed_t& o, ::scale::Decoder& decoder);

void encode(const fee_updated_t& o, ::scale::Encoder& encoder);
void decode(fee_updated_t& o, ::scale::Decoder& decoder);

void encode(const fees_withdrawn_t& o, ::scale::Encoder& encoder);
void decode(fees_withdrawn_t& o, ::scale::Decoder& decoder);

void encode(const ownership_transferred_t& o, ::scale::Encoder& encoder);
void decode(ownership_transferred_t& o, ::scale::Decoder& decoder);

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
