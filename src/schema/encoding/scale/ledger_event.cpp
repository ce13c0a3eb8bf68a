#include <safekeeper/schema/encoding/scale/ledger_event.hpp>

using namespace safekeeper::schema;

namespace safekeeper::schema::encoding::scale {

void encode(const treasure_stored_t& o, ::scale::Encoder& encoder) {
  encode(o.depositor, encoder);
  encode(o.beneficiary, encoder);
  encode(o.amount, encoder);
  encode(o.unlock_time, encoder);
  encode(o.treasure_id, encoder);
}

void decode(treasure_stored_t& o, ::scale::Decoder& decoder) {
  decode(o.depositor, decoder);
  decode(o.beneficiary, decoder);
  decode(o.amount, decoder);
  decode(o.unlock_time, decoder);
  decode(o.treasure_id, decoder);
}

void encode(const treasure_claimed_t& o, ::scale::Encoder& encoder) {
  encode(o.beneficiary, encoder);
  encode(o.amount, encoder);
  encode(o.treasure_id, encoder);
}

void decode(treasure_claimed_t& o, ::scale::Decoder& decoder) {
  decode(o.beneficiary, decoder);
  decode(o.amount, decoder);
  decode(o.treasure_id, decoder);
}

void encode(const fee_updated_t& o, ::scale::Encoder& encoder) {
  encode(o.fee_basis_points, encoder);
}

void decode(fee_updated_t& o, ::scale::Decoder& decoder) {
  decode(o.fee_basis_points, decoder);
}

void encode(const fees_withdrawn_t& o, ::scale::Encoder& encoder) {
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
}

void decode(fees_withdrawn_t& o, ::scale::Decoder& decoder) {
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
}

void encode(const ownership_transferred_t& o, ::scale::Encoder& encoder) {
  encode(o.previous_owner, encoder);
  encode(o.new_owner, encoder);
}

void decode(ownership_transferred_t& o, ::scale::Decoder& decoder) {
  decode(o.previous_owner, decoder);
  decode(o.new_owner, decoder);
}

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.block_time, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.block_time, decoder);
  decode(o.event, decoder);
}

}  // namespace safekeeper::schema::encoding::scale
