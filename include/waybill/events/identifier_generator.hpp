#pragma once

#include <waybill/schema/counter_record.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/storage/backend.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace waybill::events {

inline constexpr auto kShipmentIdPrefix = std::string_view{"SHP-"};
inline constexpr auto kShipmentIdDigits = std::size_t{10};

/// `SHP-` followed by the counter zero padded to ten digits.
waybill::schema::shipment_id_t format_shipment_id(uint64_t counter);

/// Counter encoded in a well formed shipment id.
std::optional<uint64_t> parse_shipment_id(std::string_view shipment_id);

/// Issues shipment ids from a durable counter arena.
///
/// Every increment is itself an append-only counter record and is durable
/// before the id is handed out, so a restart resumes strictly above every
/// id ever returned. Failure to read or write the counter log is fatal.
class identifier_generator final {
 public:
  identifier_generator(waybill::storage::backend_t& backend,
                       waybill::schema::clock_function_t clock);

  identifier_generator(const identifier_generator&) = delete;
  identifier_generator& operator=(const identifier_generator&) = delete;

  waybill::schema::shipment_id_t next_id();

  /// Highest counter issued so far (0 before the first id).
  uint64_t last_counter() const;

 private:
  waybill::storage::backend_t& backend_;
  waybill::schema::clock_function_t clock_;
  mutable std::mutex mutex_;
  uint64_t counter_{};
};

}  // namespace waybill::events
