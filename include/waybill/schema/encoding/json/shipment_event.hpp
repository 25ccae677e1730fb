#pragma once

#include <waybill/schema/shipment_event.hpp>
#include <nlohmann/json.hpp>

namespace waybill::schema::encoding::json {

void encode(const waybill::schema::shipment_event<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, waybill::schema::shipment_event<1>& o);

}  // namespace waybill::schema::encoding::json
