#pragma once

#include <waybill/events/event_store.hpp>
#include <waybill/lifecycle/authority_matrix.hpp>
#include <waybill/lifecycle/lifecycle_graph.hpp>
#include <waybill/schema/integrity_report.hpp>

namespace waybill::audit {

/// Full-log replay confirming the structure and legality of every shipment
/// history. All problems are collected; nothing stops at the first one.
///
/// Per shipment, in log order:
///  - `event_seq` runs 1, 2, 3, ... without gaps or repeats;
///  - timestamps never decrease;
///  - each `previous_state` is the `new_state` of the event before it (the
///    first event starts from NONE);
///  - `(previous_state, event_type) -> new_state` is an edge of the graph;
///  - the emitting role owns that edge.
/// Across the log: event ids are unique, and the storage violations found
/// while decoding (digest, position, undecodable records) are carried over.
class audit_verifier final {
 public:
  audit_verifier(const waybill::lifecycle::lifecycle_graph& graph,
                 const waybill::lifecycle::authority_matrix& authority);

  waybill::schema::integrity_report_t verify(
      const waybill::events::log_scan& scan) const;

 private:
  const waybill::lifecycle::lifecycle_graph& graph_;
  const waybill::lifecycle::authority_matrix& authority_;
};

}  // namespace waybill::audit
