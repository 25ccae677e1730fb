#pragma once
#include <waybill/schema/event_type.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/role_id.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace waybill::schema::encoding::json {

// Decoders throw std::invalid_argument or nlohmann::json::exception on a
// malformed document; the encoder turns either into a failed decode.

uint64_t decode_unsigned(const nlohmann::json& in);
uint16_t decode_schema_version(const nlohmann::json& in);

// Digests travel as 64 lowercase hex digits.
hash32_t decode_digest(const nlohmann::json& in);

// Timestamps travel as ISO-8601 UTC text with millisecond precision.
nlohmann::json encode_timestamp(const timestamp_milliseconds_t timestamp);
timestamp_milliseconds_t decode_timestamp(const nlohmann::json& in);

// Payload maps travel as a flat object of string values.
nlohmann::json encode_payload(const payload_t& payload);
payload_t decode_payload(const nlohmann::json& in);

// Enums travel as their wire names.
template <typename Enum>
nlohmann::json encode_enum(const Enum value) {
  return std::string{waybill::schema::to_string(value)};
}

template <typename Enum>
Enum decode_enum(const nlohmann::json& in) {
  auto name = in.get<std::string>();
  auto value = waybill::schema::try_from_string<Enum>(name);
  if (!value) {
    throw std::invalid_argument{"unknown enum value " + name};
  }
  return *value;
}

}  // namespace waybill::schema::encoding::json
