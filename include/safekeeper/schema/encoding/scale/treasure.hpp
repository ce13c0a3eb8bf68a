#pragma once
#include <safekeeper/schema/treasure.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const treasure<1>& o, ::scale::Encoder& encoder);
void decode(treasure<1>& o, ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
