#pragma once
#include <safekeeper/schema/treasury_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const treasury_state<1>& o, ::scale::Encoder& encoder);
void decode(treasury_state<1>& o, ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
