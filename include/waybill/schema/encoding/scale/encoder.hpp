#pragma once
#include <waybill/common/critical.hpp>
#include <waybill/schema/encoding/encoder.hpp>
#include <waybill/schema/encoding/scale/counter_record.hpp>
#include <waybill/schema/encoding/scale/log_frame.hpp>
#include <waybill/schema/encoding/scale/primitives.hpp>
#include <waybill/schema/encoding/scale/shipment_event.hpp>
#include <exception>
#include <scale/scale.hpp>

namespace waybill::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  waybill::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const waybill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const waybill::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
waybill::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    waybill::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const waybill::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    waybill::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

// Log bytes come from disk and may be damaged; a decode failure is reported
// as std::nullopt and never escapes as an exception.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const waybill::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace waybill::schema::encoding
