#pragma once

#include <waybill/lifecycle/lifecycle_table.hpp>

#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace waybill::lifecycle {

/// Closed-world directed graph over lifecycle states, each edge labelled with
/// the event type that causes it. Pairs absent from the table are forbidden.
class lifecycle_graph final {
 public:
  lifecycle_graph();
  explicit lifecycle_graph(std::span<const lifecycle_edge> edges);

  /// Target state of `event` taken from `from`, or std::nullopt when no such
  /// edge exists.
  std::optional<waybill::schema::lifecycle_state_t> allowed(
      waybill::schema::lifecycle_state_t from,
      waybill::schema::event_type_t event) const;

  /// True when at least one edge leads from `from` to `to`.
  bool connects(waybill::schema::lifecycle_state_t from,
                waybill::schema::lifecycle_state_t to) const;

  /// A state with no outgoing edges. The virtual `none` state is never
  /// terminal.
  bool is_terminal(waybill::schema::lifecycle_state_t state) const;

  std::vector<waybill::schema::event_type_t> outgoing(
      waybill::schema::lifecycle_state_t from) const;

 private:
  std::map<std::pair<waybill::schema::lifecycle_state_t,
                     waybill::schema::event_type_t>,
           waybill::schema::lifecycle_state_t>
      transitions_;
};

}  // namespace waybill::lifecycle
