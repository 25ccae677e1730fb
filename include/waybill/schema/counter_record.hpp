#pragma once

#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: counter record.
// Identifier issuance: one append-only record per issued shipment id.
namespace waybill::schema {

inline constexpr auto kIdGeneratedAction = std::string_view{"ID_GENERATED"};

template <uint16_t Version>
struct counter_record;

template <>
struct counter_record<1> final {
  uint16_t version{1};
  uint64_t counter{};
  timestamp_milliseconds_t timestamp{};
  std::string action{kIdGeneratedAction};
};

using counter_record_t = counter_record<1>;

}  // namespace waybill::schema
