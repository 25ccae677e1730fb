#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Shipment workflow: canonical catalog of facts that move a shipment between
// lifecycle states.
namespace waybill::schema {

enum class event_type_t : uint8_t {
  shipment_created = 0,
  manager_on_hold = 1,
  hold_released = 2,
  manager_approved = 3,
  supervisor_approved = 4,
  dispatched = 5,
  receiver_acknowledged = 6,
  warehouse_intake_started = 7,
  out_for_delivery = 8,
  delivery_failed = 9,
  delivery_retry = 10,
  delivery_confirmed = 11,
  lifecycle_closed = 12
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"SHIPMENT_CREATED",
                                              event_type_t::shipment_created},
    std::pair<std::string_view, event_type_t>{"MANAGER_ON_HOLD",
                                              event_type_t::manager_on_hold},
    std::pair<std::string_view, event_type_t>{"HOLD_RELEASED",
                                              event_type_t::hold_released},
    std::pair<std::string_view, event_type_t>{"MANAGER_APPROVED",
                                              event_type_t::manager_approved},
    std::pair<std::string_view, event_type_t>{
        "SUPERVISOR_APPROVED", event_type_t::supervisor_approved},
    std::pair<std::string_view, event_type_t>{"DISPATCHED",
                                              event_type_t::dispatched},
    std::pair<std::string_view, event_type_t>{
        "RECEIVER_ACKNOWLEDGED", event_type_t::receiver_acknowledged},
    std::pair<std::string_view, event_type_t>{
        "WAREHOUSE_INTAKE_STARTED", event_type_t::warehouse_intake_started},
    std::pair<std::string_view, event_type_t>{"OUT_FOR_DELIVERY",
                                              event_type_t::out_for_delivery},
    std::pair<std::string_view, event_type_t>{"DELIVERY_FAILED",
                                              event_type_t::delivery_failed},
    std::pair<std::string_view, event_type_t>{"DELIVERY_RETRY",
                                              event_type_t::delivery_retry},
    std::pair<std::string_view, event_type_t>{
        "DELIVERY_CONFIRMED", event_type_t::delivery_confirmed},
    std::pair<std::string_view, event_type_t>{"LIFECYCLE_CLOSED",
                                              event_type_t::lifecycle_closed}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("UNKNOWN");
}

}  // namespace waybill::schema
