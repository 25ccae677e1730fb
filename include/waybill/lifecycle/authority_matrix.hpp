#pragma once

#include <waybill/lifecycle/lifecycle_table.hpp>

#include <map>
#include <optional>
#include <set>
#include <span>
#include <utility>

namespace waybill::lifecycle {

/// (state, role) -> permitted event types.
///
/// Authority is a pure function of the current state: there is no session to
/// revoke, and re-entering a state through a hold/retry cycle grants exactly
/// the authority defined for that state again. Every (state, event) pair has
/// a single owning role.
class authority_matrix final {
 public:
  authority_matrix();
  explicit authority_matrix(std::span<const lifecycle_edge> edges);

  std::set<waybill::schema::event_type_t> permitted(
      waybill::schema::lifecycle_state_t state,
      waybill::schema::role_id_t role) const;

  bool is_permitted(waybill::schema::lifecycle_state_t state,
                    waybill::schema::role_id_t role,
                    waybill::schema::event_type_t event) const;

  std::optional<waybill::schema::role_id_t> owner(
      waybill::schema::lifecycle_state_t state,
      waybill::schema::event_type_t event) const;

 private:
  std::map<std::pair<waybill::schema::lifecycle_state_t,
                     waybill::schema::role_id_t>,
           std::set<waybill::schema::event_type_t>>
      permissions_;
  std::map<std::pair<waybill::schema::lifecycle_state_t,
                     waybill::schema::event_type_t>,
           waybill::schema::role_id_t>
      owners_;
};

}  // namespace waybill::lifecycle
