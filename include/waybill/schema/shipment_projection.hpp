#pragma once

#include <waybill/schema/event_type.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/role_id.hpp>
#include <cstdint>
#include <vector>

// Schema type: shipment projection.
// Read model: current state of one shipment derived by folding its events.
// Never persisted as independent truth.
namespace waybill::schema {

template <uint16_t Version>
struct shipment_projection;

template <>
struct shipment_projection<1> final {
  uint16_t version{1};
  shipment_id_t shipment_id;
  lifecycle_state_t current_state{lifecycle_state_t::none};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t last_updated{};
  uint64_t event_count{};
  event_seq_t last_event_seq{};
  std::vector<event_type_t> event_sequence;
  std::vector<role_id_t> roles_involved;
  payload_t current_payload;

  bool operator==(const shipment_projection<1>&) const = default;
};

using shipment_projection_t = shipment_projection<1>;

}  // namespace waybill::schema
