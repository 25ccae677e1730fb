#pragma once

#include <waybill/lifecycle/authority_matrix.hpp>
#include <waybill/lifecycle/lifecycle_graph.hpp>
#include <waybill/schema/lifecycle_error_code.hpp>
#include <waybill/schema/primitives.hpp>

#include <string>

namespace waybill::lifecycle {

/// Outcome of checking a proposed event against the current state.
struct validation_decision final {
  waybill::schema::lifecycle_error_code code{
      waybill::schema::lifecycle_error_code::ok};
  waybill::schema::lifecycle_state_t new_state{
      waybill::schema::lifecycle_state_t::none};
  std::string reason;

  bool accepted() const {
    return code == waybill::schema::lifecycle_error_code::ok;
  }
};

/// Combines the lifecycle graph and the authority matrix. The graph is
/// consulted first, so an unreachable event is always reported as an invalid
/// transition even when the role would also be unauthorized.
class transition_validator final {
 public:
  transition_validator(const lifecycle_graph& graph,
                       const authority_matrix& authority);

  validation_decision validate(
      const waybill::schema::shipment_id_t& shipment_id,
      waybill::schema::event_type_t event_type,
      waybill::schema::role_id_t role,
      waybill::schema::lifecycle_state_t current_state) const;

 private:
  const lifecycle_graph& graph_;
  const authority_matrix& authority_;
};

}  // namespace waybill::lifecycle
