#pragma once
#include <safekeeper/schema/fee_policy.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const fee_policy_t& o, ::scale::Encoder& encoder);
void decode(fee_policy_t& o, ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

// Schema types live in safekeeper::schema, so the codecs are made visible
// there for argument-dependent lookup from inside the SCALE templates.
namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
