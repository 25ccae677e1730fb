#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Shipment workflow: actor capability that emits events (sender side,
// dispatch system, receiver, warehouse, customer).
namespace waybill::schema {

enum class role_id_t : uint8_t {
  sender = 0,
  sender_manager = 1,
  sender_supervisor = 2,
  system = 3,
  receiver_manager = 4,
  warehouse_manager = 5,
  customer = 6
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"SENDER", role_id_t::sender},
    std::pair<std::string_view, role_id_t>{"SENDER_MANAGER",
                                           role_id_t::sender_manager},
    std::pair<std::string_view, role_id_t>{"SENDER_SUPERVISOR",
                                           role_id_t::sender_supervisor},
    std::pair<std::string_view, role_id_t>{"SYSTEM", role_id_t::system},
    std::pair<std::string_view, role_id_t>{"RECEIVER_MANAGER",
                                           role_id_t::receiver_manager},
    std::pair<std::string_view, role_id_t>{"WAREHOUSE_MANAGER",
                                           role_id_t::warehouse_manager},
    std::pair<std::string_view, role_id_t>{"CUSTOMER", role_id_t::customer},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("UNKNOWN");
}

}  // namespace waybill::schema
