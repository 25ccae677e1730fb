#pragma once

#include <waybill/schema/counter_record.hpp>
#include <nlohmann/json.hpp>

namespace waybill::schema::encoding::json {

void encode(const waybill::schema::counter_record<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, waybill::schema::counter_record<1>& o);

}  // namespace waybill::schema::encoding::json
