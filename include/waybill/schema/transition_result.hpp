#pragma once

#include <waybill/schema/lifecycle_error_code.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: transition result.
// Write API envelope returned to callers of create/transition: code, the
// states bridged, the assigned sequence and human readable diagnostics.
namespace waybill::schema {

template <uint16_t Version>
struct transition_result;

template <>
struct transition_result<1> final {
  uint16_t version{1};
  lifecycle_error_code code{lifecycle_error_code::ok};
  shipment_id_t shipment_id;
  event_id_t event_id;
  event_seq_t event_seq{};
  lifecycle_state_t previous_state{lifecycle_state_t::none};
  lifecycle_state_t new_state{lifecycle_state_t::none};
  std::string log;
  std::string info;
  std::string codespace;

  bool accepted() const { return succeeded(code); }
};

using transition_result_t = transition_result<1>;

}  // namespace waybill::schema
