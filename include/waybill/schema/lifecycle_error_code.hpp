#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace waybill::schema {

enum class lifecycle_error_code : uint32_t {
  ok = 0,
  invalid_transition = 1,
  unauthorized = 2,
  duplicate_event = 3,
  concurrent_conflict = 4,
  corrupt_record = 5,
  storage_failure = 6,
  shipment_not_found = 7,
  invalid_event = 8,
};

inline constexpr auto kLifecycleErrorCodeMappings = std::array{
    std::pair<std::string_view, lifecycle_error_code>{
        "ok", lifecycle_error_code::ok},
    std::pair<std::string_view, lifecycle_error_code>{
        "invalid_transition", lifecycle_error_code::invalid_transition},
    std::pair<std::string_view, lifecycle_error_code>{
        "unauthorized", lifecycle_error_code::unauthorized},
    std::pair<std::string_view, lifecycle_error_code>{
        "duplicate_event", lifecycle_error_code::duplicate_event},
    std::pair<std::string_view, lifecycle_error_code>{
        "concurrent_conflict", lifecycle_error_code::concurrent_conflict},
    std::pair<std::string_view, lifecycle_error_code>{
        "corrupt_record", lifecycle_error_code::corrupt_record},
    std::pair<std::string_view, lifecycle_error_code>{
        "storage_failure", lifecycle_error_code::storage_failure},
    std::pair<std::string_view, lifecycle_error_code>{
        "shipment_not_found", lifecycle_error_code::shipment_not_found},
    std::pair<std::string_view, lifecycle_error_code>{
        "invalid_event", lifecycle_error_code::invalid_event}};

inline constexpr std::string_view to_string(const lifecycle_error_code value) {
  return to_string(value, kLifecycleErrorCodeMappings).value_or("unknown");
}

/// Codes after which the requested fact is durably present in the log.
inline constexpr bool succeeded(const lifecycle_error_code value) {
  return value == lifecycle_error_code::ok ||
         value == lifecycle_error_code::duplicate_event;
}

}  // namespace waybill::schema
