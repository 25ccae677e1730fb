#pragma once

#include <waybill/schema/shipment_event.hpp>
#include <scale/scale.hpp>

namespace waybill::schema::encoding::scale {

void encode(waybill::schema::shipment_event<1>&& o, ::scale::Encoder& encoder);
void decode(waybill::schema::shipment_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
