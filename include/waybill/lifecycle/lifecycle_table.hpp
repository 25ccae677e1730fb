#pragma once

#include <waybill/schema/event_type.hpp>
#include <waybill/schema/lifecycle_state.hpp>
#include <waybill/schema/role_id.hpp>

#include <array>

namespace waybill::lifecycle {

/// One legal transition and the single role that owns it.
struct lifecycle_edge final {
  waybill::schema::lifecycle_state_t from{};
  waybill::schema::event_type_t event{};
  waybill::schema::lifecycle_state_t to{};
  waybill::schema::role_id_t owner{};
};

// Static definition of the shipment lifecycle. The graph and the authority
// matrix are both built from this table and never from runtime branching.
// Cycles: CREATED <-> MANAGER_ON_HOLD and OUT_FOR_DELIVERY <-> DELIVERY_FAILED.
// A held shipment may also be approved straight from MANAGER_ON_HOLD.
inline constexpr auto kLifecycleEdges = std::array{
    lifecycle_edge{waybill::schema::lifecycle_state_t::none,
                   waybill::schema::event_type_t::shipment_created,
                   waybill::schema::lifecycle_state_t::created,
                   waybill::schema::role_id_t::sender},
    lifecycle_edge{waybill::schema::lifecycle_state_t::created,
                   waybill::schema::event_type_t::manager_approved,
                   waybill::schema::lifecycle_state_t::manager_approved,
                   waybill::schema::role_id_t::sender_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::created,
                   waybill::schema::event_type_t::manager_on_hold,
                   waybill::schema::lifecycle_state_t::manager_on_hold,
                   waybill::schema::role_id_t::sender_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::manager_on_hold,
                   waybill::schema::event_type_t::hold_released,
                   waybill::schema::lifecycle_state_t::created,
                   waybill::schema::role_id_t::sender_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::manager_on_hold,
                   waybill::schema::event_type_t::manager_approved,
                   waybill::schema::lifecycle_state_t::manager_approved,
                   waybill::schema::role_id_t::sender_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::manager_approved,
                   waybill::schema::event_type_t::supervisor_approved,
                   waybill::schema::lifecycle_state_t::supervisor_approved,
                   waybill::schema::role_id_t::sender_supervisor},
    lifecycle_edge{waybill::schema::lifecycle_state_t::supervisor_approved,
                   waybill::schema::event_type_t::dispatched,
                   waybill::schema::lifecycle_state_t::in_transit,
                   waybill::schema::role_id_t::system},
    lifecycle_edge{waybill::schema::lifecycle_state_t::in_transit,
                   waybill::schema::event_type_t::receiver_acknowledged,
                   waybill::schema::lifecycle_state_t::receiver_acknowledged,
                   waybill::schema::role_id_t::receiver_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::receiver_acknowledged,
                   waybill::schema::event_type_t::warehouse_intake_started,
                   waybill::schema::lifecycle_state_t::warehouse_intake,
                   waybill::schema::role_id_t::warehouse_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::warehouse_intake,
                   waybill::schema::event_type_t::out_for_delivery,
                   waybill::schema::lifecycle_state_t::out_for_delivery,
                   waybill::schema::role_id_t::warehouse_manager},
    lifecycle_edge{waybill::schema::lifecycle_state_t::out_for_delivery,
                   waybill::schema::event_type_t::delivery_confirmed,
                   waybill::schema::lifecycle_state_t::delivered,
                   waybill::schema::role_id_t::customer},
    lifecycle_edge{waybill::schema::lifecycle_state_t::out_for_delivery,
                   waybill::schema::event_type_t::delivery_failed,
                   waybill::schema::lifecycle_state_t::delivery_failed,
                   waybill::schema::role_id_t::system},
    lifecycle_edge{waybill::schema::lifecycle_state_t::delivery_failed,
                   waybill::schema::event_type_t::delivery_retry,
                   waybill::schema::lifecycle_state_t::out_for_delivery,
                   waybill::schema::role_id_t::system},
    lifecycle_edge{waybill::schema::lifecycle_state_t::delivered,
                   waybill::schema::event_type_t::lifecycle_closed,
                   waybill::schema::lifecycle_state_t::lifecycle_closed,
                   waybill::schema::role_id_t::system}};

}  // namespace waybill::lifecycle
