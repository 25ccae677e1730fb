#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <waybill/blake3/hash.hpp>
#include <waybill/common/critical.hpp>
#include <waybill/events/event_store.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

using namespace waybill::schema;

namespace waybill::events {

namespace {

integrity_violation make_violation(const violation_kind_t kind,
                                   const uint64_t position,
                                   std::string message) {
  auto violation = integrity_violation{};
  violation.kind = kind;
  violation.position = position;
  violation.message = std::move(message);
  return violation;
}

// Name of the first text field that is not valid UTF-8.
std::optional<std::string> first_malformed_text(const shipment_event_t& event) {
  if (!is_valid_utf8(event.event_id)) {
    return std::string{"event_id"};
  }
  if (!is_valid_utf8(event.shipment_id)) {
    return std::string{"shipment_id"};
  }
  for (const auto& [key, value] : event.payload) {
    if (!is_valid_utf8(key) || !is_valid_utf8(value)) {
      return std::string{"payload"};
    }
  }
  return std::nullopt;
}

}  // namespace

std::string make_event_id(const shipment_id_t& shipment_id,
                          const event_seq_t event_seq) {
  return fmt::format("EVT-{}-{:02}", shipment_id, event_seq);
}

event_store::event_store(waybill::storage::backend_t& backend,
                         clock_function_t clock)
    : backend_{backend}, clock_{std::move(clock)} {
  auto loaded = scan(read_mode::lenient);
  if (loaded.code == lifecycle_error_code::storage_failure) {
    waybill::common::critical("Failed to read the event log");
  }

  for (auto& logged : loaded.events) {
    index(std::move(logged));
  }
  last_digest_ = loaded.tail_digest;
  last_position_ = std::max(loaded.tail_position, loaded.records_scanned);
  load_violations_ = std::move(loaded.violations);

  if (!load_violations_.empty()) {
    spdlog::warn("Event log loaded with {} violation(s); first: {}",
                 load_violations_.size(), load_violations_.front().message);
  }
  spdlog::info("Event log ready: {} event(s) across {} shipment(s)",
               log_.size(), shipments_.size());
}

void event_store::index(logged_event&& logged) {
  auto& event = logged.event;
  event_ids_.try_emplace(
      event.event_id,
      event_location{event.shipment_id, event.event_seq, logged.position});
  shipments_[event.shipment_id].push_back(log_.size());
  log_.push_back(std::move(event));
}

append_result_t event_store::append(shipment_event_t event,
                                    std::optional<event_seq_t> expected_seq) {
  auto result = append_result_t{};
  if (auto field = first_malformed_text(event)) {
    result.code = lifecycle_error_code::invalid_event;
    result.log = fmt::format("event {} is not valid UTF-8", *field);
    return result;
  }

  auto append_lock = std::lock_guard{append_mutex_};

  auto head = event_seq_t{0};
  auto current_state = lifecycle_state_t::none;
  auto last_timestamp = timestamp_milliseconds_t{0};
  {
    auto lock = std::shared_lock{mutex_};
    if (!event.event_id.empty()) {
      if (auto it = event_ids_.find(event.event_id);
          it != std::end(event_ids_)) {
        const auto& existing = it->second;
        if (existing.shipment_id != event.shipment_id) {
          result.code = lifecycle_error_code::invalid_event;
          result.log = fmt::format(
              "event {} is already recorded for shipment {}, not {}",
              event.event_id, existing.shipment_id, event.shipment_id);
          return result;
        }
        result.code = lifecycle_error_code::duplicate_event;
        result.event_seq = existing.event_seq;
        result.position = existing.position;
        result.log = fmt::format("event {} already recorded as {}#{}",
                                 event.event_id, existing.shipment_id,
                                 existing.event_seq);
        spdlog::debug("{}", result.log);
        return result;
      }
    }

    if (auto it = shipments_.find(event.shipment_id);
        it != std::end(shipments_) && !it->second.empty()) {
      const auto& newest = log_[it->second.back()];
      head = newest.event_seq;
      current_state = newest.new_state;
      last_timestamp = newest.timestamp;
    }
  }

  if (expected_seq && *expected_seq != head) {
    result.code = lifecycle_error_code::concurrent_conflict;
    result.event_seq = head;
    result.log = fmt::format("shipment {} is at sequence {}, expected {}",
                             event.shipment_id, head, *expected_seq);
    return result;
  }
  if (event.previous_state != current_state) {
    result.code = lifecycle_error_code::concurrent_conflict;
    result.event_seq = head;
    result.log = fmt::format("shipment {} is in state {}, not {}",
                             event.shipment_id, to_string(current_state),
                             to_string(event.previous_state));
    return result;
  }

  event.event_seq = head + 1;
  if (event.event_id.empty()) {
    event.event_id = make_event_id(event.shipment_id, event.event_seq);
  }
  if (event.timestamp == 0) {
    event.timestamp = clock_();
  }
  event.timestamp = std::max(event.timestamp, last_timestamp);

  auto frame = log_frame_t{};
  frame.position = last_position_ + 1;
  frame.record = waybill::storage::encode_record(backend_, event);
  frame.digest = waybill::blake3::chain(last_digest_,
                                        make_bytes_view(frame.record));
  auto encoded = waybill::storage::encode_record(backend_, frame);

  // No index lock is held here; readers keep seeing the previous prefix.
  if (!waybill::storage::append(backend_, waybill::storage::log_channel::events,
                                make_bytes_view(encoded))) {
    result.code = lifecycle_error_code::storage_failure;
    result.log = fmt::format("failed to persist event {} for {}",
                             event.event_id, event.shipment_id);
    spdlog::error("{}", result.log);
    return result;
  }

  last_digest_ = frame.digest;
  last_position_ = frame.position;
  result.code = lifecycle_error_code::ok;
  result.event_seq = event.event_seq;
  result.position = frame.position;

  auto lock = std::unique_lock{mutex_};
  index(logged_event{frame.position, frame.digest, std::move(event)});
  return result;
}

std::vector<shipment_event_t> event_store::read_all() const {
  auto lock = std::shared_lock{mutex_};
  return log_;
}

std::vector<shipment_event_t> event_store::read_for(
    const shipment_id_t& shipment_id) const {
  auto lock = std::shared_lock{mutex_};
  auto events = std::vector<shipment_event_t>{};
  auto it = shipments_.find(shipment_id);
  if (it == std::end(shipments_)) {
    return events;
  }
  events.reserve(it->second.size());
  for (auto offset : it->second) {
    events.push_back(log_[offset]);
  }
  std::stable_sort(std::begin(events), std::end(events),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.event_seq < rhs.event_seq;
                   });
  return events;
}

std::vector<shipment_id_t> event_store::shipment_ids() const {
  auto lock = std::shared_lock{mutex_};
  auto ids = std::vector<shipment_id_t>{};
  ids.reserve(shipments_.size());
  for (const auto& [shipment_id, offsets] : shipments_) {
    static_cast<void>(offsets);
    ids.push_back(shipment_id);
  }
  return ids;
}

event_seq_t event_store::head_seq(const shipment_id_t& shipment_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = shipments_.find(shipment_id);
  if (it == std::end(shipments_) || it->second.empty()) {
    return 0;
  }
  return log_[it->second.back()].event_seq;
}

uint64_t event_store::event_count() const {
  auto lock = std::shared_lock{mutex_};
  return log_.size();
}

std::optional<event_location> event_store::locate(
    const event_id_t& event_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = event_ids_.find(event_id);
  if (it == std::end(event_ids_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<integrity_violation> event_store::load_violations() const {
  auto lock = std::shared_lock{mutex_};
  return load_violations_;
}

log_scan event_store::scan(const read_mode mode) const {
  auto result = log_scan{};
  auto entries = [&] {
    auto append_lock = std::lock_guard{append_mutex_};
    return waybill::storage::read(backend_,
                                  waybill::storage::log_channel::events);
  }();
  if (!entries) {
    result.code = lifecycle_error_code::storage_failure;
    return result;
  }

  auto previous_digest = make_zero_hash();
  auto chain_known = true;
  auto expected_position = uint64_t{1};

  auto corrupt = [&](const uint64_t position, std::string message) {
    result.violations.push_back(make_violation(
        violation_kind_t::corrupt_record, position, std::move(message)));
    chain_known = false;
    ++expected_position;
    if (mode == read_mode::strict) {
      result.code = lifecycle_error_code::corrupt_record;
      return true;
    }
    return false;
  };

  for (const auto& entry : *entries) {
    ++result.records_scanned;
    if (!entry.bytes) {
      if (corrupt(entry.ordinal, fmt::format("record {} is unreadable: {}",
                                             entry.ordinal, entry.error))) {
        break;
      }
      continue;
    }

    auto frame = waybill::storage::try_decode_record<log_frame_t>(
        backend_, make_bytes_view(*entry.bytes));
    if (!frame || frame->version != 1) {
      auto reason = frame ? fmt::format("unsupported frame version {}",
                                        frame->version)
                          : std::string{"frame does not decode"};
      if (corrupt(entry.ordinal, fmt::format("record {}: {}", entry.ordinal,
                                             reason))) {
        break;
      }
      continue;
    }

    if (frame->position != expected_position) {
      result.violations.push_back(make_violation(
          violation_kind_t::position_gap, frame->position,
          fmt::format("record {} claims position {}, expected {}",
                      entry.ordinal, frame->position, expected_position)));
      expected_position = frame->position;
    }
    ++expected_position;

    if (chain_known) {
      auto expected_digest =
          waybill::blake3::chain(previous_digest, make_bytes_view(frame->record));
      if (expected_digest != frame->digest) {
        result.violations.push_back(make_violation(
            violation_kind_t::digest_mismatch, frame->position,
            fmt::format("record at position {} does not match its digest {}",
                        frame->position, to_hex(frame->digest))));
      }
    }
    previous_digest = frame->digest;
    chain_known = true;
    result.tail_digest = frame->digest;
    result.tail_position = frame->position;

    auto event = waybill::storage::try_decode_record<shipment_event_t>(
        backend_, make_bytes_view(frame->record));
    if (!event || event->version != 1) {
      auto reason = event ? fmt::format("unsupported event version {}",
                                        event->version)
                          : std::string{"event does not decode"};
      // The frame itself was sound, so the digest chain is still known.
      result.violations.push_back(make_violation(
          violation_kind_t::corrupt_record, frame->position,
          fmt::format("record at position {}: {}", frame->position, reason)));
      if (mode == read_mode::strict) {
        result.code = lifecycle_error_code::corrupt_record;
        break;
      }
      continue;
    }

    result.events.push_back(
        logged_event{frame->position, frame->digest, std::move(*event)});
  }

  return result;
}

}  // namespace waybill::events
