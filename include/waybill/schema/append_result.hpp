#pragma once

#include <waybill/schema/lifecycle_error_code.hpp>
#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: append result.
// Event store outcome: assigned sequence on success, the existing sequence on
// a replayed event id, or the failure code.
namespace waybill::schema {

template <uint16_t Version>
struct append_result;

template <>
struct append_result<1> final {
  uint16_t version{1};
  lifecycle_error_code code{lifecycle_error_code::ok};
  event_seq_t event_seq{};
  uint64_t position{};
  std::string log;
};

using append_result_t = append_result<1>;

}  // namespace waybill::schema
