#pragma once

#include <waybill/schema/log_frame.hpp>
#include <scale/scale.hpp>

namespace waybill::schema::encoding::scale {

void encode(waybill::schema::log_frame<1>&& o, ::scale::Encoder& encoder);
void decode(waybill::schema::log_frame<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
