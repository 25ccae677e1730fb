#pragma once

#include <waybill/schema/counter_record.hpp>
#include <scale/scale.hpp>

namespace waybill::schema::encoding::scale {

void encode(waybill::schema::counter_record<1>&& o, ::scale::Encoder& encoder);
void decode(waybill::schema::counter_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
