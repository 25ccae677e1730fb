#include <waybill/schema/encoding/json/primitives.hpp>
#include <waybill/schema/encoding/json/shipment_event.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::json {

void encode(const shipment_event<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  out["schema_version"] = o.version;
  out["event_id"] = o.event_id;
  out["shipment_id"] = o.shipment_id;
  out["event_seq"] = o.event_seq;
  out["event_type"] = encode_enum(o.event_type);
  out["previous_state"] = encode_enum(o.previous_state);
  out["new_state"] = encode_enum(o.new_state);
  out["emitting_role"] = encode_enum(o.emitting_role);
  out["timestamp"] = encode_timestamp(o.timestamp);
  out["payload"] = encode_payload(o.payload);
}

void decode(const nlohmann::json& in, shipment_event<1>& o) {
  o.version = decode_schema_version(in.at("schema_version"));
  o.event_id = in.at("event_id").get<std::string>();
  o.shipment_id = in.at("shipment_id").get<std::string>();
  o.event_seq = decode_unsigned(in.at("event_seq"));
  o.event_type = decode_enum<event_type_t>(in.at("event_type"));
  o.previous_state = decode_enum<lifecycle_state_t>(in.at("previous_state"));
  o.new_state = decode_enum<lifecycle_state_t>(in.at("new_state"));
  o.emitting_role = decode_enum<role_id_t>(in.at("emitting_role"));
  o.timestamp = decode_timestamp(in.at("timestamp"));
  o.payload = decode_payload(in.at("payload"));
}

}  // namespace waybill::schema::encoding::json
