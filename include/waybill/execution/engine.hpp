#pragma once

#include <waybill/audit/audit_verifier.hpp>
#include <waybill/events/event_store.hpp>
#include <waybill/events/identifier_generator.hpp>
#include <waybill/lifecycle/authority_matrix.hpp>
#include <waybill/lifecycle/lifecycle_graph.hpp>
#include <waybill/lifecycle/transition_validator.hpp>
#include <waybill/schema/audit_report.hpp>
#include <waybill/schema/integrity_report.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/shipment_event.hpp>
#include <waybill/schema/shipment_projection.hpp>
#include <waybill/schema/transition_result.hpp>
#include <waybill/storage/backend.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace waybill::execution {

struct engine_options final {
  std::string data_dir{"waybill-data"};
  waybill::storage::backend_kind_t backend{
      waybill::storage::backend_kind_t::append_file};
  /// Integrity checks stop at the first undecodable record.
  bool strict_reads{false};
  waybill::schema::clock_function_t clock{waybill::schema::system_clock()};
};

/// Shipment lifecycle engine: the only write path into the event log.
///
/// Writes are validated against the lifecycle graph and authority matrix and
/// then appended, both under a per-shipment lock so two callers racing on one
/// shipment are totally ordered. Reads rebuild projections from the log on
/// demand and never wait on writers to other shipments.
class engine final {
 public:
  explicit engine(engine_options options);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Issue a new shipment id and record its SHIPMENT_CREATED event, emitted
  /// by the SENDER role. Replaying a known `event_id` returns the shipment it
  /// created with `duplicate_event` and issues nothing new; an id already used
  /// by a later event of some shipment is `invalid_event`.
  waybill::schema::transition_result_t create_shipment(
      waybill::schema::payload_t initial_payload,
      std::optional<waybill::schema::event_id_t> event_id = std::nullopt);

  /// Validate and append one lifecycle event.
  ///
  /// Rejections leave the shipment untouched: `invalid_transition` when the
  /// event is not reachable from the current state, `unauthorized` when the
  /// role does not own it, `concurrent_conflict` when `expected_seq` is stale,
  /// `shipment_not_found` for an id no creation event was recorded for.
  waybill::schema::transition_result_t transition_shipment(
      const waybill::schema::shipment_id_t& shipment_id,
      waybill::schema::event_type_t event_type,
      waybill::schema::role_id_t role,
      waybill::schema::payload_t extra_payload = {},
      std::optional<waybill::schema::event_id_t> event_id = std::nullopt,
      std::optional<waybill::schema::event_seq_t> expected_seq = std::nullopt);

  std::optional<waybill::schema::shipment_projection_t> get_shipment(
      const waybill::schema::shipment_id_t& shipment_id) const;

  /// Shipments currently in `state`, most recently updated first.
  std::vector<waybill::schema::shipment_projection_t> get_shipments_by_state(
      waybill::schema::lifecycle_state_t state) const;

  /// Every shipment, ordered by id.
  std::vector<waybill::schema::shipment_projection_t> list_shipments() const;

  std::vector<waybill::schema::shipment_event_t> shipment_history(
      const waybill::schema::shipment_id_t& shipment_id) const;

  std::map<waybill::schema::lifecycle_state_t, uint64_t> state_distribution()
      const;

  /// Replay the full log from storage and check every shipment history.
  waybill::schema::integrity_report_t verify_integrity() const;

  waybill::schema::audit_report_t audit_report() const;

  const waybill::events::event_store& event_log() const { return store_; }

  /// Per-shipment write locks allocated so far; one per shipment written.
  std::size_t lock_slot_count() const;

 private:
  std::mutex& lock_for(const waybill::schema::shipment_id_t& shipment_id);
  waybill::events::read_mode scan_mode() const;

  engine_options options_;
  waybill::storage::backend_t backend_;
  waybill::events::identifier_generator identifiers_;
  waybill::events::event_store store_;
  waybill::lifecycle::lifecycle_graph graph_;
  waybill::lifecycle::authority_matrix authority_;
  waybill::lifecycle::transition_validator validator_;
  waybill::audit::audit_verifier verifier_;

  mutable std::mutex shipment_locks_mutex_;
  std::map<waybill::schema::shipment_id_t, std::unique_ptr<std::mutex>>
      shipment_locks_;
};

}  // namespace waybill::execution
