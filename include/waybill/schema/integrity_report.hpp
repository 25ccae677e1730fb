#pragma once

#include <waybill/schema/enum_string.hpp>
#include <waybill/schema/lifecycle_error_code.hpp>
#include <waybill/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: integrity report.
// Audit outcome of a full-log replay: every violation found, counted by kind,
// with the first offending record kept separately.
namespace waybill::schema {

enum class violation_kind_t : uint8_t {
  corrupt_record = 0,
  digest_mismatch = 1,
  position_gap = 2,
  sequence_gap = 3,
  duplicate_sequence = 4,
  timestamp_regression = 5,
  invalid_transition = 6,
  broken_chain = 7,
  unauthorized_role = 8,
  duplicate_event_id = 9
};

inline constexpr auto kViolationKindMappings = std::array{
    std::pair<std::string_view, violation_kind_t>{
        "CORRUPT_RECORD", violation_kind_t::corrupt_record},
    std::pair<std::string_view, violation_kind_t>{
        "DIGEST_MISMATCH", violation_kind_t::digest_mismatch},
    std::pair<std::string_view, violation_kind_t>{
        "POSITION_GAP", violation_kind_t::position_gap},
    std::pair<std::string_view, violation_kind_t>{
        "SEQUENCE_GAP", violation_kind_t::sequence_gap},
    std::pair<std::string_view, violation_kind_t>{
        "DUPLICATE_SEQUENCE", violation_kind_t::duplicate_sequence},
    std::pair<std::string_view, violation_kind_t>{
        "TIMESTAMP_REGRESSION", violation_kind_t::timestamp_regression},
    std::pair<std::string_view, violation_kind_t>{
        "INVALID_TRANSITION", violation_kind_t::invalid_transition},
    std::pair<std::string_view, violation_kind_t>{
        "BROKEN_CHAIN", violation_kind_t::broken_chain},
    std::pair<std::string_view, violation_kind_t>{
        "UNAUTHORIZED_ROLE", violation_kind_t::unauthorized_role},
    std::pair<std::string_view, violation_kind_t>{
        "DUPLICATE_EVENT_ID", violation_kind_t::duplicate_event_id}};

inline constexpr std::string_view to_string(const violation_kind_t value) {
  return to_string(value, kViolationKindMappings).value_or("UNKNOWN");
}

struct integrity_violation final {
  violation_kind_t kind{};
  // Global 1-based log position of the offending record (0 when unknown).
  uint64_t position{};
  std::optional<shipment_id_t> shipment_id;
  std::optional<event_seq_t> event_seq;
  std::string message;
};

template <uint16_t Version>
struct integrity_report;

template <>
struct integrity_report<1> final {
  uint16_t version{1};
  bool valid{true};
  // storage_failure when the log could not be read at all, corrupt_record
  // when a strict read stopped early.
  lifecycle_error_code code{lifecycle_error_code::ok};
  uint64_t records_scanned{};
  uint64_t events_replayed{};
  uint64_t shipments_checked{};
  std::map<violation_kind_t, uint64_t> violation_counts;
  std::optional<integrity_violation> first_violation;
  std::vector<integrity_violation> violations;

  /// Shipments named by at least one violation, ordered by id.
  std::vector<shipment_id_t> offending_shipments() const;
};

using integrity_report_t = integrity_report<1>;

}  // namespace waybill::schema
