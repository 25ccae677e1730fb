#include <waybill/schema/encoding/scale/log_frame.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(log_frame<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.position, encoder);
  encode(o.record, encoder);
  encode(o.digest, encoder);
}

void decode(log_frame<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.position, decoder);
  decode(o.record, decoder);
  decode(o.digest, decoder);
}

}  // namespace waybill::schema::encoding::scale
