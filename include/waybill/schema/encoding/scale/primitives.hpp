#pragma once
#include <waybill/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

// Payload maps travel as an ordered sequence of (key, value) pairs.
void encode(payload_t&& o, ::scale::Encoder& encoder);
void decode(payload_t&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
