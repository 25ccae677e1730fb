#include <spdlog/spdlog.h>
#include <waybill/common/critical.hpp>
#include <waybill/lifecycle/lifecycle_graph.hpp>

using namespace waybill::schema;

namespace waybill::lifecycle {

lifecycle_graph::lifecycle_graph()
    : lifecycle_graph{std::span<const lifecycle_edge>{kLifecycleEdges}} {}

lifecycle_graph::lifecycle_graph(std::span<const lifecycle_edge> edges) {
  for (const auto& edge : edges) {
    auto [it, inserted] =
        transitions_.try_emplace(std::pair{edge.from, edge.event}, edge.to);
    if (!inserted && it->second != edge.to) {
      spdlog::error("Lifecycle table maps {} --{}--> both {} and {}",
                    to_string(edge.from), to_string(edge.event),
                    to_string(it->second), to_string(edge.to));
      waybill::common::critical("ambiguous lifecycle table");
    }
  }
}

std::optional<lifecycle_state_t> lifecycle_graph::allowed(
    const lifecycle_state_t from,
    const event_type_t event) const {
  auto it = transitions_.find(std::pair{from, event});
  if (it == std::end(transitions_)) {
    return std::nullopt;
  }
  return it->second;
}

bool lifecycle_graph::connects(const lifecycle_state_t from,
                               const lifecycle_state_t to) const {
  for (const auto& [key, target] : transitions_) {
    if (key.first == from && target == to) {
      return true;
    }
  }
  return false;
}

bool lifecycle_graph::is_terminal(const lifecycle_state_t state) const {
  if (state == lifecycle_state_t::none) {
    return false;
  }
  return outgoing(state).empty();
}

std::vector<event_type_t> lifecycle_graph::outgoing(
    const lifecycle_state_t from) const {
  auto events = std::vector<event_type_t>{};
  for (const auto& [key, target] : transitions_) {
    static_cast<void>(target);
    if (key.first == from) {
      events.push_back(key.second);
    }
  }
  return events;
}

}  // namespace waybill::lifecycle
