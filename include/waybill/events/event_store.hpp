#pragma once

#include <waybill/schema/append_result.hpp>
#include <waybill/schema/integrity_report.hpp>
#include <waybill/schema/lifecycle_error_code.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/shipment_event.hpp>
#include <waybill/storage/backend.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace waybill::events {

/// How a full read reacts to a record it cannot decode.
enum class read_mode : uint8_t {
  /// Skip the record and report it as a violation.
  lenient = 0,
  /// Stop at the first corrupt record.
  strict = 1
};

/// One event decoded from the durable log together with its framing.
struct logged_event final {
  uint64_t position{};
  waybill::schema::hash32_t digest{};
  waybill::schema::shipment_event_t event;
};

/// Result of decoding the whole event channel.
struct log_scan final {
  waybill::schema::lifecycle_error_code code{
      waybill::schema::lifecycle_error_code::ok};
  uint64_t records_scanned{};
  std::vector<logged_event> events;
  /// Storage level problems only: undecodable records, digest mismatches and
  /// position gaps. Lifecycle rules are checked by the audit verifier.
  std::vector<waybill::schema::integrity_violation> violations;
  /// Digest and position of the last frame that decoded, whether or not its
  /// event did. The next append chains from here.
  waybill::schema::hash32_t tail_digest{};
  uint64_t tail_position{};
};

/// Where an already recorded event id lives.
struct event_location final {
  waybill::schema::shipment_id_t shipment_id;
  waybill::schema::event_seq_t event_seq{};
  uint64_t position{};
};

/// Deterministic id given to events appended without a caller supplied id.
std::string make_event_id(const waybill::schema::shipment_id_t& shipment_id,
                          waybill::schema::event_seq_t event_seq);

/// Single source of truth: append-only log of immutable shipment events.
///
/// The log is decoded once at construction and kept indexed in memory. Append
/// is the only mutation; it assigns `event_seq`, chains the frame digest and
/// returns only after the backend reports the record durable. Appends are
/// serialized among themselves; the index is extended only once the record
/// is durable, so readers never wait on a backend write.
class event_store final {
 public:
  event_store(waybill::storage::backend_t& backend,
              waybill::schema::clock_function_t clock);

  event_store(const event_store&) = delete;
  event_store& operator=(const event_store&) = delete;

  /// Append one event. `event_seq` is assigned here; `timestamp` is taken
  /// from the clock when zero and never allowed to run backwards within a
  /// shipment. An already known `event_id` is a no-op reporting
  /// `duplicate_event` with the existing sequence, or `invalid_event` when it
  /// was recorded for another shipment. Identifiers and payload must be valid
  /// UTF-8, otherwise `invalid_event`. `expected_seq`, when set,
  /// must equal the shipment's current head sequence and `previous_state`
  /// must equal its current state, otherwise `concurrent_conflict`.
  waybill::schema::append_result_t append(
      waybill::schema::shipment_event_t event,
      std::optional<waybill::schema::event_seq_t> expected_seq = std::nullopt);

  std::vector<waybill::schema::shipment_event_t> read_all() const;
  std::vector<waybill::schema::shipment_event_t> read_for(
      const waybill::schema::shipment_id_t& shipment_id) const;
  std::vector<waybill::schema::shipment_id_t> shipment_ids() const;

  /// Sequence of the newest event of the shipment (0 when unknown).
  waybill::schema::event_seq_t head_seq(
      const waybill::schema::shipment_id_t& shipment_id) const;

  uint64_t event_count() const;

  std::optional<event_location> locate(
      const waybill::schema::event_id_t& event_id) const;

  /// Re-read and decode the backend from the first record.
  log_scan scan(read_mode mode) const;

  /// Storage violations found while loading the log at construction.
  std::vector<waybill::schema::integrity_violation> load_violations() const;

 private:
  void index(logged_event&& logged);

  waybill::storage::backend_t& backend_;
  waybill::schema::clock_function_t clock_;

  // Held for a whole append and for backend scans; guards the chain tail.
  mutable std::mutex append_mutex_;
  waybill::schema::hash32_t last_digest_{};
  uint64_t last_position_{};

  // Guards the in-memory index below.
  mutable std::shared_mutex mutex_;
  std::vector<waybill::schema::shipment_event_t> log_;
  std::map<waybill::schema::shipment_id_t, std::vector<std::size_t>>
      shipments_;
  std::unordered_map<waybill::schema::event_id_t, event_location> event_ids_;
  std::vector<waybill::schema::integrity_violation> load_violations_;
};

}  // namespace waybill::events
