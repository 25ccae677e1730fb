#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <waybill/lifecycle/transition_validator.hpp>

using namespace waybill::schema;

namespace waybill::lifecycle {

transition_validator::transition_validator(const lifecycle_graph& graph,
                                           const authority_matrix& authority)
    : graph_{graph}, authority_{authority} {}

validation_decision transition_validator::validate(
    const shipment_id_t& shipment_id,
    const event_type_t event_type,
    const role_id_t role,
    const lifecycle_state_t current_state) const {
  auto decision = validation_decision{};

  auto target = graph_.allowed(current_state, event_type);
  if (!target) {
    decision.code = lifecycle_error_code::invalid_transition;
    decision.reason =
        fmt::format("invalid transition: {} is not reachable from {}",
                    to_string(event_type), to_string(current_state));
    spdlog::debug("Rejected {} for {}: {}", to_string(event_type), shipment_id,
                  decision.reason);
    return decision;
  }

  if (!authority_.is_permitted(current_state, role, event_type)) {
    decision.code = lifecycle_error_code::unauthorized;
    auto owner = authority_.owner(current_state, event_type);
    decision.reason = fmt::format(
        "unauthorized role: {} may not emit {} in state {} (owner {})",
        to_string(role), to_string(event_type), to_string(current_state),
        owner ? to_string(*owner) : std::string_view{"none"});
    spdlog::debug("Rejected {} for {}: {}", to_string(event_type), shipment_id,
                  decision.reason);
    return decision;
  }

  decision.new_state = *target;
  return decision;
}

}  // namespace waybill::lifecycle
