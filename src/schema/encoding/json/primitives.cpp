#include <waybill/schema/encoding/json/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace waybill::schema::encoding::json {

uint64_t decode_unsigned(const nlohmann::json& in) {
  if (!in.is_number_unsigned()) {
    throw std::invalid_argument{"expected an unsigned integer"};
  }
  return in.get<uint64_t>();
}

uint16_t decode_schema_version(const nlohmann::json& in) {
  auto version = decode_unsigned(in);
  if (version > UINT16_MAX) {
    throw std::invalid_argument{"schema_version out of range"};
  }
  return static_cast<uint16_t>(version);
}

hash32_t decode_digest(const nlohmann::json& in) {
  auto bytes = waybill::schema::try_from_hex(in.get<std::string>());
  if (!bytes || bytes->size() != std::tuple_size_v<hash32_t>) {
    throw std::invalid_argument{"digest must be 32 hex-encoded bytes"};
  }
  auto digest = hash32_t{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(digest));
  return digest;
}

nlohmann::json encode_timestamp(const timestamp_milliseconds_t timestamp) {
  return waybill::schema::to_iso8601(timestamp);
}

timestamp_milliseconds_t decode_timestamp(const nlohmann::json& in) {
  auto text = in.get<std::string>();
  auto timestamp = waybill::schema::try_from_iso8601(text);
  if (!timestamp) {
    throw std::invalid_argument{"malformed timestamp " + text};
  }
  return *timestamp;
}

nlohmann::json encode_payload(const payload_t& payload) {
  auto out = nlohmann::json::object();
  for (const auto& [key, value] : payload) {
    out[key] = value;
  }
  return out;
}

payload_t decode_payload(const nlohmann::json& in) {
  if (!in.is_object()) {
    throw std::invalid_argument{"payload must be an object"};
  }
  auto payload = payload_t{};
  for (const auto& [key, value] : in.items()) {
    payload.emplace(key, value.get<std::string>());
  }
  return payload;
}

}  // namespace waybill::schema::encoding::json
