#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <waybill/execution/engine.hpp>
#include <waybill/projection/projector.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace waybill::schema;

namespace waybill::execution {

namespace {

inline constexpr auto kCreateCodespace = std::string_view{"waybill.create"};
inline constexpr auto kTransitionCodespace =
    std::string_view{"waybill.transition"};

transition_result_t make_result(const shipment_id_t& shipment_id,
                                 const std::string_view codespace) {
  auto result = transition_result_t{};
  result.shipment_id = shipment_id;
  result.codespace = std::string{codespace};
  return result;
}

void copy_append_outcome(const append_result_t& appended,
                         transition_result_t& result) {
  result.code = appended.code;
  result.event_seq = appended.event_seq;
  if (!appended.log.empty()) {
    result.log = appended.log;
  }
}

}  // namespace

engine::engine(engine_options options)
    : options_{std::move(options)},
      backend_{waybill::storage::make_backend(options_.backend,
                                              options_.data_dir)},
      identifiers_{backend_, options_.clock},
      store_{backend_, options_.clock},
      validator_{graph_, authority_},
      verifier_{graph_, authority_} {
  spdlog::info("Shipment engine ready at '{}' ({} backend, {} reads)",
               options_.data_dir, waybill::storage::to_string(options_.backend),
               options_.strict_reads ? "strict" : "lenient");
}

std::size_t engine::lock_slot_count() const {
  auto lock = std::lock_guard{shipment_locks_mutex_};
  return shipment_locks_.size();
}

std::mutex& engine::lock_for(const shipment_id_t& shipment_id) {
  auto lock = std::lock_guard{shipment_locks_mutex_};
  auto& slot = shipment_locks_[shipment_id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

waybill::events::read_mode engine::scan_mode() const {
  return options_.strict_reads ? waybill::events::read_mode::strict
                               : waybill::events::read_mode::lenient;
}

transition_result_t engine::create_shipment(
    payload_t initial_payload,
    std::optional<event_id_t> event_id) {
  if (event_id) {
    if (auto existing = store_.locate(*event_id)) {
      auto result = make_result(existing->shipment_id, kCreateCodespace);
      result.event_id = *event_id;
      if (existing->event_seq != 1) {
        result.code = lifecycle_error_code::invalid_event;
        result.log = fmt::format("event id {} belongs to event {} of {}",
                                 *event_id, existing->event_seq,
                                 existing->shipment_id);
        return result;
      }
      result.code = lifecycle_error_code::duplicate_event;
      result.event_seq = existing->event_seq;
      result.new_state = lifecycle_state_t::created;
      result.log = "shipment already created";
      return result;
    }
  }

  auto shipment_id = identifiers_.next_id();
  auto result = make_result(shipment_id, kCreateCodespace);
  auto lock = std::lock_guard{lock_for(shipment_id)};

  auto decision =
      validator_.validate(shipment_id, event_type_t::shipment_created,
                          role_id_t::sender, lifecycle_state_t::none);
  if (!decision.accepted()) {
    result.code = decision.code;
    result.log = decision.reason;
    return result;
  }

  auto event = shipment_event_t{};
  event.event_id = event_id.value_or(std::string{});
  event.shipment_id = shipment_id;
  event.event_type = event_type_t::shipment_created;
  event.previous_state = lifecycle_state_t::none;
  event.new_state = decision.new_state;
  event.emitting_role = role_id_t::sender;
  event.timestamp = options_.clock();
  event.payload = std::move(initial_payload);

  auto appended = store_.append(std::move(event), event_seq_t{0});
  copy_append_outcome(appended, result);

  if (appended.code == lifecycle_error_code::invalid_event && event_id) {
    // Lost a race against a replay of the same creation request; the store
    // refuses the id for this fresh shipment.
    if (auto existing = store_.locate(*event_id);
        existing && existing->event_seq == 1) {
      result.shipment_id = existing->shipment_id;
      result.code = lifecycle_error_code::duplicate_event;
      result.event_seq = existing->event_seq;
      result.log = "shipment already created";
    }
  }
  if (succeeded(result.code)) {
    result.new_state = decision.new_state;
    result.event_id = event_id.value_or(
        waybill::events::make_event_id(shipment_id, appended.event_seq));
  }

  if (result.code == lifecycle_error_code::ok) {
    result.info = fmt::format("{} -> {}", to_string(result.previous_state),
                              to_string(result.new_state));
    spdlog::info("Created shipment {}", shipment_id);
  } else if (result.code != lifecycle_error_code::duplicate_event) {
    spdlog::error("Failed to create shipment {}: {}", shipment_id, result.log);
  }
  return result;
}

transition_result_t engine::transition_shipment(
    const shipment_id_t& shipment_id,
    const event_type_t event_type,
    const role_id_t role,
    payload_t extra_payload,
    std::optional<event_id_t> event_id,
    std::optional<event_seq_t> expected_seq) {
  auto result = make_result(shipment_id, kTransitionCodespace);
  // Shipments are never removed, so an unknown id stays unknown and needs no
  // lock slot.
  if (store_.head_seq(shipment_id) == 0) {
    result.code = lifecycle_error_code::shipment_not_found;
    result.log = fmt::format("shipment {} not found", shipment_id);
    return result;
  }
  auto lock = std::lock_guard{lock_for(shipment_id)};

  if (event_id) {
    if (auto existing = store_.locate(*event_id)) {
      result.event_id = *event_id;
      if (existing->shipment_id != shipment_id) {
        result.code = lifecycle_error_code::invalid_event;
        result.log = fmt::format("event id {} belongs to shipment {}",
                                 *event_id, existing->shipment_id);
        return result;
      }
      result.code = lifecycle_error_code::duplicate_event;
      result.event_seq = existing->event_seq;
      result.log = "event already recorded";
      return result;
    }
  }

  auto history = store_.read_for(shipment_id);
  auto current = waybill::projection::project(history);
  if (!current) {
    result.code = lifecycle_error_code::shipment_not_found;
    result.log = fmt::format("shipment {} not found", shipment_id);
    return result;
  }
  result.previous_state = current->current_state;
  result.new_state = current->current_state;
  result.event_seq = current->last_event_seq;

  if (expected_seq && *expected_seq != current->last_event_seq) {
    result.code = lifecycle_error_code::concurrent_conflict;
    result.log = fmt::format("shipment {} is at sequence {}, expected {}",
                             shipment_id, current->last_event_seq,
                             *expected_seq);
    return result;
  }

  auto decision = validator_.validate(shipment_id, event_type, role,
                                      current->current_state);
  if (!decision.accepted()) {
    result.code = decision.code;
    result.log = decision.reason;
    spdlog::info("Rejected {} on {} by {}: {}", to_string(event_type),
                 shipment_id, to_string(role), to_string(decision.code));
    return result;
  }

  auto event = shipment_event_t{};
  event.event_id = event_id.value_or(std::string{});
  event.shipment_id = shipment_id;
  event.event_type = event_type;
  event.previous_state = current->current_state;
  event.new_state = decision.new_state;
  event.emitting_role = role;
  event.timestamp = options_.clock();
  event.payload = std::move(extra_payload);

  auto appended = store_.append(std::move(event), current->last_event_seq);
  copy_append_outcome(appended, result);
  if (succeeded(appended.code)) {
    result.event_id = event_id.value_or(
        waybill::events::make_event_id(shipment_id, appended.event_seq));
  }
  if (appended.code != lifecycle_error_code::ok) {
    if (appended.code != lifecycle_error_code::duplicate_event) {
      spdlog::warn("Append of {} on {} failed: {}", to_string(event_type),
                   shipment_id, result.log);
    }
    return result;
  }

  result.new_state = decision.new_state;
  result.info = fmt::format("{} -> {}", to_string(result.previous_state),
                            to_string(result.new_state));
  spdlog::info("{} {} by {} ({})", shipment_id, to_string(event_type),
               to_string(role), result.info);
  return result;
}

std::optional<shipment_projection_t> engine::get_shipment(
    const shipment_id_t& shipment_id) const {
  return waybill::projection::project(store_.read_for(shipment_id));
}

std::vector<shipment_projection_t> engine::list_shipments() const {
  auto projections = std::vector<shipment_projection_t>{};
  for (const auto& shipment_id : store_.shipment_ids()) {
    if (auto projection = get_shipment(shipment_id)) {
      projections.push_back(std::move(*projection));
    }
  }
  return projections;
}

std::vector<shipment_projection_t> engine::get_shipments_by_state(
    const lifecycle_state_t state) const {
  auto matching = std::vector<shipment_projection_t>{};
  for (auto& projection : list_shipments()) {
    if (projection.current_state == state) {
      matching.push_back(std::move(projection));
    }
  }
  std::sort(std::begin(matching), std::end(matching),
            [](const auto& lhs, const auto& rhs) {
              if (lhs.last_updated != rhs.last_updated) {
                return lhs.last_updated > rhs.last_updated;
              }
              return lhs.shipment_id < rhs.shipment_id;
            });
  return matching;
}

std::vector<shipment_event_t> engine::shipment_history(
    const shipment_id_t& shipment_id) const {
  return store_.read_for(shipment_id);
}

std::map<lifecycle_state_t, uint64_t> engine::state_distribution() const {
  auto distribution = std::map<lifecycle_state_t, uint64_t>{};
  for (const auto& projection : list_shipments()) {
    ++distribution[projection.current_state];
  }
  return distribution;
}

integrity_report_t engine::verify_integrity() const {
  return verifier_.verify(store_.scan(scan_mode()));
}

audit_report_t engine::audit_report() const {
  auto scan = store_.scan(scan_mode());
  auto report = audit_report_t{};
  report.integrity = verifier_.verify(scan);
  report.total_events = scan.events.size();

  auto histories = std::map<shipment_id_t, std::vector<shipment_event_t>>{};
  for (const auto& logged : scan.events) {
    const auto& event = logged.event;
    ++report.event_type_distribution[event.event_type];
    ++report.role_distribution[event.emitting_role];
    if (!report.first_event_time || event.timestamp < *report.first_event_time) {
      report.first_event_time = event.timestamp;
    }
    if (!report.last_event_time || event.timestamp > *report.last_event_time) {
      report.last_event_time = event.timestamp;
    }
    histories[event.shipment_id].push_back(event);
  }

  report.total_shipments = histories.size();
  for (const auto& [shipment_id, events] : histories) {
    static_cast<void>(shipment_id);
    if (auto projection = waybill::projection::project(events)) {
      ++report.current_state_distribution[projection->current_state];
    }
  }

  if (scan.records_scanned == 0 && report.integrity.valid) {
    report.integrity_status = integrity_status_t::empty;
  } else if (report.integrity.valid) {
    report.integrity_status = integrity_status_t::valid;
  } else {
    report.integrity_status = integrity_status_t::corrupted;
  }
  return report;
}

}  // namespace waybill::execution
