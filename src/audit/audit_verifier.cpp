#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <waybill/audit/audit_verifier.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <utility>

using namespace waybill::schema;

namespace waybill::audit {

namespace {

struct shipment_replay final {
  event_seq_t last_seq{};
  std::set<event_seq_t> seen;
  timestamp_milliseconds_t last_timestamp{};
  lifecycle_state_t state{lifecycle_state_t::none};
};

}  // namespace

audit_verifier::audit_verifier(
    const waybill::lifecycle::lifecycle_graph& graph,
    const waybill::lifecycle::authority_matrix& authority)
    : graph_{graph}, authority_{authority} {}

integrity_report_t audit_verifier::verify(
    const waybill::events::log_scan& scan) const {
  auto report = integrity_report_t{};
  report.code = scan.code;
  report.records_scanned = scan.records_scanned;
  report.events_replayed = scan.events.size();
  report.violations = scan.violations;

  auto replays = std::map<shipment_id_t, shipment_replay>{};
  auto event_ids = std::map<event_id_t, uint64_t>{};

  for (const auto& logged : scan.events) {
    const auto& event = logged.event;
    auto flag = [&](const violation_kind_t kind, std::string message) {
      auto violation = integrity_violation{};
      violation.kind = kind;
      violation.position = logged.position;
      violation.shipment_id = event.shipment_id;
      violation.event_seq = event.event_seq;
      violation.message = std::move(message);
      report.violations.push_back(std::move(violation));
    };

    if (auto [it, inserted] =
            event_ids.try_emplace(event.event_id, logged.position);
        !inserted) {
      flag(violation_kind_t::duplicate_event_id,
           fmt::format("event id {} already used at position {}",
                       event.event_id, it->second));
    }

    auto& replay = replays[event.shipment_id];

    if (replay.seen.contains(event.event_seq)) {
      flag(violation_kind_t::duplicate_sequence,
           fmt::format("{} repeats event_seq {}", event.shipment_id,
                       event.event_seq));
    } else if (event.event_seq != replay.last_seq + 1) {
      flag(violation_kind_t::sequence_gap,
           fmt::format("{} has event_seq {} after {}", event.shipment_id,
                       event.event_seq, replay.last_seq));
    }
    replay.seen.insert(event.event_seq);
    replay.last_seq = std::max(replay.last_seq, event.event_seq);

    if (event.timestamp < replay.last_timestamp) {
      flag(violation_kind_t::timestamp_regression,
           fmt::format("{} event_seq {} is timestamped {} before {}",
                       event.shipment_id, event.event_seq,
                       to_iso8601(event.timestamp),
                       to_iso8601(replay.last_timestamp)));
    }
    replay.last_timestamp = std::max(replay.last_timestamp, event.timestamp);

    if (event.previous_state != replay.state) {
      flag(violation_kind_t::broken_chain,
           fmt::format("{} event_seq {} starts from {} but the shipment was {}",
                       event.shipment_id, event.event_seq,
                       to_string(event.previous_state),
                       to_string(replay.state)));
    }

    auto target = graph_.allowed(event.previous_state, event.event_type);
    if (!target || *target != event.new_state) {
      flag(violation_kind_t::invalid_transition,
           fmt::format("{} event_seq {}: {} --{}--> {} is not a lifecycle edge",
                       event.shipment_id, event.event_seq,
                       to_string(event.previous_state),
                       to_string(event.event_type),
                       to_string(event.new_state)));
    } else if (!authority_.is_permitted(event.previous_state,
                                        event.emitting_role,
                                        event.event_type)) {
      flag(violation_kind_t::unauthorized_role,
           fmt::format("{} event_seq {}: {} may not emit {} from {}",
                       event.shipment_id, event.event_seq,
                       to_string(event.emitting_role),
                       to_string(event.event_type),
                       to_string(event.previous_state)));
    }
    replay.state = event.new_state;
  }

  report.shipments_checked = replays.size();

  std::stable_sort(std::begin(report.violations), std::end(report.violations),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.position < rhs.position;
                   });
  for (const auto& violation : report.violations) {
    ++report.violation_counts[violation.kind];
  }
  if (!report.violations.empty()) {
    report.first_violation = report.violations.front();
  }
  report.valid = report.violations.empty() &&
                 report.code == lifecycle_error_code::ok;

  if (report.valid) {
    spdlog::info("Integrity verified: {} event(s), {} shipment(s)",
                 report.events_replayed, report.shipments_checked);
  } else {
    spdlog::warn("Integrity check found {} violation(s) in {} record(s)",
                 report.violations.size(), report.records_scanned);
  }
  return report;
}

}  // namespace waybill::audit
