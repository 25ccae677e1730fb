#pragma once

#include <waybill/schema/event_type.hpp>
#include <waybill/schema/integrity_report.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/role_id.hpp>
#include <cstdint>
#include <map>
#include <optional>

// Schema type: audit report.
// Summary of the whole log for operators: totals, distributions and the
// integrity verdict of a full replay.
namespace waybill::schema {

enum class integrity_status_t : uint8_t { empty = 0, valid = 1, corrupted = 2 };

inline constexpr auto kIntegrityStatusMappings = std::array{
    std::pair<std::string_view, integrity_status_t>{"EMPTY",
                                                    integrity_status_t::empty},
    std::pair<std::string_view, integrity_status_t>{"VALID",
                                                    integrity_status_t::valid},
    std::pair<std::string_view, integrity_status_t>{
        "CORRUPTED", integrity_status_t::corrupted}};

inline constexpr std::string_view to_string(const integrity_status_t value) {
  return to_string(value, kIntegrityStatusMappings).value_or("UNKNOWN");
}

template <uint16_t Version>
struct audit_report;

template <>
struct audit_report<1> final {
  uint16_t version{1};
  uint64_t total_events{};
  uint64_t total_shipments{};
  integrity_status_t integrity_status{integrity_status_t::empty};
  std::map<event_type_t, uint64_t> event_type_distribution;
  std::map<role_id_t, uint64_t> role_distribution;
  std::map<lifecycle_state_t, uint64_t> current_state_distribution;
  std::optional<timestamp_milliseconds_t> first_event_time;
  std::optional<timestamp_milliseconds_t> last_event_time;
  integrity_report<1> integrity;
};

using audit_report_t = audit_report<1>;

}  // namespace waybill::schema
