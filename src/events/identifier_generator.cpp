#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <waybill/events/identifier_generator.hpp>

#include <algorithm>
#include <charconv>

using namespace waybill::schema;

namespace waybill::events {

shipment_id_t format_shipment_id(const uint64_t counter) {
  return fmt::format("{}{:0{}}", kShipmentIdPrefix, counter, kShipmentIdDigits);
}

std::optional<uint64_t> parse_shipment_id(const std::string_view shipment_id) {
  if (!shipment_id.starts_with(kShipmentIdPrefix)) {
    return std::nullopt;
  }
  auto digits = shipment_id.substr(kShipmentIdPrefix.size());
  if (digits.size() < kShipmentIdDigits) {
    return std::nullopt;
  }
  auto counter = uint64_t{0};
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), counter);
  if (error != std::errc{} || end != digits.data() + digits.size() ||
      counter == 0) {
    return std::nullopt;
  }
  return counter;
}

identifier_generator::identifier_generator(waybill::storage::backend_t& backend,
                                           clock_function_t clock)
    : backend_{backend}, clock_{std::move(clock)} {
  auto entries =
      waybill::storage::read(backend_, waybill::storage::log_channel::counters);
  if (!entries) {
    waybill::common::critical("Failed to read the shipment counter log");
  }

  for (const auto& entry : *entries) {
    auto record = std::optional<counter_record_t>{};
    if (entry.bytes) {
      record = waybill::storage::try_decode_record<counter_record_t>(
          backend_, make_bytes_view(*entry.bytes));
    }
    if (!record || record->version != 1 ||
        record->action != kIdGeneratedAction) {
      if (entry.truncated) {
        // Torn final write: the id was never returned to a caller.
        spdlog::warn("Ignoring torn counter record {}", entry.ordinal);
        continue;
      }
      waybill::common::critical(
          "Shipment counter record {} is corrupt: {}", entry.ordinal,
          entry.error.empty() ? std::string{"undecodable"} : entry.error);
    }
    counter_ = std::max(counter_, record->counter);
  }
  spdlog::info("Shipment counter resumes after {}", counter_);
}

shipment_id_t identifier_generator::next_id() {
  auto lock = std::lock_guard{mutex_};
  auto record = counter_record_t{};
  record.counter = counter_ + 1;
  record.timestamp = clock_();

  auto encoded = waybill::storage::encode_record(backend_, record);
  if (!waybill::storage::append(backend_,
                                waybill::storage::log_channel::counters,
                                make_bytes_view(encoded))) {
    waybill::common::critical("Failed to persist shipment counter {}",
                              record.counter);
  }
  counter_ = record.counter;
  return format_shipment_id(counter_);
}

uint64_t identifier_generator::last_counter() const {
  auto lock = std::lock_guard{mutex_};
  return counter_;
}

}  // namespace waybill::events
