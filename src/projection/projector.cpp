#include <waybill/projection/projector.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

using namespace waybill::schema;

namespace waybill::projection {

shipment_projection_t apply(shipment_projection_t projection,
                            const shipment_event_t& event) {
  if (projection.event_count == 0) {
    projection.shipment_id = event.shipment_id;
    projection.created_at = event.timestamp;
  }
  projection.current_state = event.new_state;
  projection.last_updated = event.timestamp;
  projection.last_event_seq = event.event_seq;
  ++projection.event_count;
  projection.event_sequence.push_back(event.event_type);

  auto& roles = projection.roles_involved;
  auto position =
      std::lower_bound(std::begin(roles), std::end(roles), event.emitting_role);
  if (position == std::end(roles) || *position != event.emitting_role) {
    roles.insert(position, event.emitting_role);
  }

  for (const auto& [key, value] : event.payload) {
    projection.current_payload.insert_or_assign(key, value);
  }
  return projection;
}

std::optional<shipment_projection_t> project(
    std::span<const shipment_event_t> events) {
  if (events.empty()) {
    return std::nullopt;
  }

  auto ordered = std::vector<const shipment_event_t*>{};
  ordered.reserve(events.size());
  for (const auto& event : events) {
    ordered.push_back(&event);
  }
  std::stable_sort(std::begin(ordered), std::end(ordered),
                   [](const auto* lhs, const auto* rhs) {
                     return lhs->event_seq < rhs->event_seq;
                   });

  auto projection = shipment_projection_t{};
  for (const auto* event : ordered) {
    projection = apply(std::move(projection), *event);
  }
  return projection;
}

}  // namespace waybill::projection
