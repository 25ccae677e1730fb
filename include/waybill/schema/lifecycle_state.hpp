#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lifecycle state.
// Shipment workflow: node of the lifecycle graph a shipment occupies. `none`
// is the virtual state preceding the first event of every shipment.
namespace waybill::schema {

enum class lifecycle_state_t : uint8_t {
  none = 0,
  created = 1,
  manager_on_hold = 2,
  manager_approved = 3,
  supervisor_approved = 4,
  in_transit = 5,
  receiver_acknowledged = 6,
  warehouse_intake = 7,
  out_for_delivery = 8,
  delivery_failed = 9,
  delivered = 10,
  lifecycle_closed = 11
};

inline constexpr auto kLifecycleStateMappings = std::array{
    std::pair<std::string_view, lifecycle_state_t>{"NONE",
                                                   lifecycle_state_t::none},
    std::pair<std::string_view, lifecycle_state_t>{"CREATED",
                                                   lifecycle_state_t::created},
    std::pair<std::string_view, lifecycle_state_t>{
        "MANAGER_ON_HOLD", lifecycle_state_t::manager_on_hold},
    std::pair<std::string_view, lifecycle_state_t>{
        "MANAGER_APPROVED", lifecycle_state_t::manager_approved},
    std::pair<std::string_view, lifecycle_state_t>{
        "SUPERVISOR_APPROVED", lifecycle_state_t::supervisor_approved},
    std::pair<std::string_view, lifecycle_state_t>{
        "IN_TRANSIT", lifecycle_state_t::in_transit},
    std::pair<std::string_view, lifecycle_state_t>{
        "RECEIVER_ACKNOWLEDGED", lifecycle_state_t::receiver_acknowledged},
    std::pair<std::string_view, lifecycle_state_t>{
        "WAREHOUSE_INTAKE", lifecycle_state_t::warehouse_intake},
    std::pair<std::string_view, lifecycle_state_t>{
        "OUT_FOR_DELIVERY", lifecycle_state_t::out_for_delivery},
    std::pair<std::string_view, lifecycle_state_t>{
        "DELIVERY_FAILED", lifecycle_state_t::delivery_failed},
    std::pair<std::string_view, lifecycle_state_t>{
        "DELIVERED", lifecycle_state_t::delivered},
    std::pair<std::string_view, lifecycle_state_t>{
        "LIFECYCLE_CLOSED", lifecycle_state_t::lifecycle_closed}};

template <>
inline std::optional<lifecycle_state_t> try_from_string<lifecycle_state_t>(
    const std::string_view value) {
  return from_string(value, kLifecycleStateMappings);
}

inline constexpr std::string_view to_string(const lifecycle_state_t value) {
  return to_string(value, kLifecycleStateMappings).value_or("UNKNOWN");
}

}  // namespace waybill::schema
