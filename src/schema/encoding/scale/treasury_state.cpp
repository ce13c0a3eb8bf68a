#include <safekeeper/schema/encoding/scale/fee_policy.hpp>
#include <safekeeper/schema/encoding/scale/treasury_state.hpp>

using namespace safekeeper::schema;

namespace safekeeper::schema::encoding::scale {

void encode(const treasury_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.next_treasure_id, encoder);
  encode(o.fee_basis_points, encoder);
  encode(o.collected_fees, encoder);
  encode(o.owner, encoder);
  encode(o.fee_policy, encoder);
}

void decode(treasury_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.next_treasure_id, decoder);
  decode(o.fee_basis_points, decoder);
  decode(o.collected_fees, decoder);
  decode(o.owner, decoder);
  decode(o.fee_policy, decoder);
}

}  // namespace safekeeper::schema::encoding::scale
