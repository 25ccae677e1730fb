#include <waybill/schema/encoding/scale/primitives.hpp>
#include <waybill/schema/encoding/scale/shipment_event.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(shipment_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.shipment_id, encoder);
  encode(o.event_seq, encoder);
  encode(o.event_type, encoder);
  encode(o.previous_state, encoder);
  encode(o.new_state, encoder);
  encode(o.emitting_role, encoder);
  encode(o.timestamp, encoder);
  encode(o.payload, encoder);
}

void decode(shipment_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.shipment_id, decoder);
  decode(o.event_seq, decoder);
  decode(o.event_type, decoder);
  decode(o.previous_state, decoder);
  decode(o.new_state, decoder);
  decode(o.emitting_role, decoder);
  decode(o.timestamp, decoder);
  decode(o.payload, decoder);
}

}  // namespace waybill::schema::encoding::scale
