#pragma once
#include <waybill/common/critical.hpp>
#include <waybill/schema/encoding/encoder.hpp>
#include <waybill/schema/encoding/json/counter_record.hpp>
#include <waybill/schema/encoding/json/log_frame.hpp>
#include <waybill/schema/encoding/json/primitives.hpp>
#include <waybill/schema/encoding/json/shipment_event.hpp>
#include <exception>
#include <nlohmann/json.hpp>

namespace waybill::schema::encoding {

struct json_encoder_tag {};

/// One compact JSON document per object. Object keys are emitted in sorted
/// order, so equal objects always produce equal bytes.
template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  waybill::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const waybill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const waybill::schema::bytes_view_t& bytes);
};

using json_encoder_t = encoder<json_encoder_tag>;

template <typename T>
waybill::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  try {
    auto document = nlohmann::json{};
    json::encode(obj, document);
    return waybill::schema::make_bytes(document.dump());
  } catch (const std::exception& e) {
    waybill::common::critical("failed to encode JSON object: {}", e.what());
  }
}

template <typename T>
T encoder<json_encoder_tag>::decode(
    const waybill::schema::bytes_view_t& bytes) {
  try {
    auto obj = T{};
    json::decode(nlohmann::json::parse(std::begin(bytes), std::end(bytes)),
                 obj);
    return obj;
  } catch (const std::exception& e) {
    waybill::common::critical("failed to decode JSON bytes: {}", e.what());
  }
}

// Log lines come from disk and may be damaged; a decode failure is reported
// as std::nullopt and never escapes as an exception.
template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const waybill::schema::bytes_view_t& bytes) {
  auto document =
      nlohmann::json::parse(std::begin(bytes), std::end(bytes), nullptr, false);
  if (document.is_discarded()) {
    return std::nullopt;
  }
  try {
    auto obj = T{};
    json::decode(document, obj);
    return obj;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace waybill::schema::encoding
