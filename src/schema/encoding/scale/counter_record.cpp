#include <waybill/schema/encoding/scale/counter_record.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(counter_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.counter, encoder);
  encode(o.timestamp, encoder);
  encode(o.action, encoder);
}

void decode(counter_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.counter, decoder);
  decode(o.timestamp, decoder);
  decode(o.action, decoder);
}

}  // namespace waybill::schema::encoding::scale
