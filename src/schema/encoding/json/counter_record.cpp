#include <waybill/schema/encoding/json/counter_record.hpp>
#include <waybill/schema/encoding/json/primitives.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::json {

void encode(const counter_record<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  out["schema_version"] = o.version;
  out["counter"] = o.counter;
  out["timestamp"] = encode_timestamp(o.timestamp);
  out["action"] = o.action;
}

void decode(const nlohmann::json& in, counter_record<1>& o) {
  o.version = decode_schema_version(in.at("schema_version"));
  o.counter = decode_unsigned(in.at("counter"));
  o.timestamp = decode_timestamp(in.at("timestamp"));
  o.action = in.at("action").get<std::string>();
}

}  // namespace waybill::schema::encoding::json
