#pragma once

#include <waybill/schema/shipment_event.hpp>
#include <waybill/schema/shipment_projection.hpp>

#include <optional>
#include <span>

namespace waybill::projection {

/// Fold one event into a projection: the state moves to `new_state`, payload
/// keys of the event win over earlier ones, and the counters advance.
waybill::schema::shipment_projection_t apply(
    waybill::schema::shipment_projection_t projection,
    const waybill::schema::shipment_event_t& event);

/// Fold the events of one shipment in `event_seq` order. Returns std::nullopt
/// for an empty sequence. The result depends on the events alone.
std::optional<waybill::schema::shipment_projection_t> project(
    std::span<const waybill::schema::shipment_event_t> events);

}  // namespace waybill::projection
