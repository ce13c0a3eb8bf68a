#include <safekeeper/schema/encoding/scale/treasure.hpp>

using namespace safekeeper::schema;

namespace safekeeper::schema::encoding::scale {

void encode(const treasure<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.amount, encoder);
  encode(o.unlock_time, encoder);
  encode(o.claimed, encoder);
  encode(o.depositor, encoder);
  encode(o.beneficiary, encoder);
}

void decode(treasure<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.amount, decoder);
  decode(o.unlock_time, decoder);
  decode(o.claimed, decoder);
  decode(o.depositor, decoder);
  decode(o.beneficiary, decoder);
}

}  // namespace safekeeper::schema::encoding::scale
