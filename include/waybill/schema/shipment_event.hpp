#pragma once

#include <waybill/schema/event_type.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/role_id.hpp>
#include <cstdint>

// Schema type: shipment event.
// Shipment workflow: immutable fact describing one lifecycle transition.
// `version` is the record schema version; older versions stay decodable.
namespace waybill::schema {

template <uint16_t Version>
struct shipment_event;

template <>
struct shipment_event<1> final {
  uint16_t version{1};
  event_id_t event_id;
  shipment_id_t shipment_id;
  event_seq_t event_seq{};
  event_type_t event_type{};
  lifecycle_state_t previous_state{};
  lifecycle_state_t new_state{};
  role_id_t emitting_role{};
  timestamp_milliseconds_t timestamp{};
  payload_t payload;
};

using shipment_event_t = shipment_event<1>;

}  // namespace waybill::schema
