#pragma once
#include <waybill/schema/primitives.hpp>
#include <optional>
#include <span>

namespace waybill::schema::encoding {

// Codec selected at build time by tag. Record layouts never depend on the
// tag; only the byte representation does.
template <typename Library>
struct encoder {
  template <typename T>
  waybill::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const waybill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const waybill::schema::bytes_view_t& bytes);
};

}  // namespace waybill::schema::encoding
