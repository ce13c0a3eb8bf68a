#include <safekeeper/schema/encoding/scale/fee_policy.hpp>

using namespace safekeeper::schema;

namespace safekeeper::schema::encoding::scale {

void encode(const fee_policy_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(fee_policy_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<fee_policy_t>(raw);
}

}  // namespace safekeeper::schema::encoding::scale
