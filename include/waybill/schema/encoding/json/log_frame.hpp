#pragma once

#include <waybill/schema/log_frame.hpp>
#include <nlohmann/json.hpp>

namespace waybill::schema::encoding::json {

// A frame is its record's JSON object with `position` and `digest` added at
// the top level. The record must itself be a JSON object.
void encode(const waybill::schema::log_frame<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, waybill::schema::log_frame<1>& o);

}  // namespace waybill::schema::encoding::json
