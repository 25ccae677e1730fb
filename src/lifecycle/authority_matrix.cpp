#include <spdlog/spdlog.h>
#include <waybill/common/critical.hpp>
#include <waybill/lifecycle/authority_matrix.hpp>

using namespace waybill::schema;

namespace waybill::lifecycle {

authority_matrix::authority_matrix()
    : authority_matrix{std::span<const lifecycle_edge>{kLifecycleEdges}} {}

authority_matrix::authority_matrix(std::span<const lifecycle_edge> edges) {
  for (const auto& edge : edges) {
    auto [it, inserted] =
        owners_.try_emplace(std::pair{edge.from, edge.event}, edge.owner);
    if (!inserted && it->second != edge.owner) {
      spdlog::error("Authority table assigns {} in state {} to both {} and {}",
                    to_string(edge.event), to_string(edge.from),
                    to_string(it->second), to_string(edge.owner));
      waybill::common::critical("non-exclusive authority table");
    }
    permissions_[std::pair{edge.from, edge.owner}].insert(edge.event);
  }
}

std::set<event_type_t> authority_matrix::permitted(
    const lifecycle_state_t state,
    const role_id_t role) const {
  auto it = permissions_.find(std::pair{state, role});
  if (it == std::end(permissions_)) {
    return {};
  }
  return it->second;
}

bool authority_matrix::is_permitted(const lifecycle_state_t state,
                                    const role_id_t role,
                                    const event_type_t event) const {
  auto it = permissions_.find(std::pair{state, role});
  return it != std::end(permissions_) && it->second.contains(event);
}

std::optional<role_id_t> authority_matrix::owner(
    const lifecycle_state_t state,
    const event_type_t event) const {
  auto it = owners_.find(std::pair{state, event});
  if (it == std::end(owners_)) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace waybill::lifecycle
