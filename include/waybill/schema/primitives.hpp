#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace waybill::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using event_seq_t = uint64_t;
using shipment_id_t = std::string;
using event_id_t = std::string;

// Opaque key/value data attached to an event; merged into projections.
using payload_t = std::map<std::string, std::string>;

// Injectable source of UTC wall-clock time in milliseconds since the epoch.
using clock_function_t = std::function<timestamp_milliseconds_t()>;

bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);

hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);

std::optional<bytes_t> try_from_hex(const std::string_view encoded);

/// True when bytes form well-formed UTF-8 (no overlongs or surrogates).
bool is_valid_utf8(const std::string_view bytes);

clock_function_t system_clock();

/// Render a UTC millisecond timestamp as ISO-8601 (`2026-01-19T14:30:45.123Z`).
std::string to_iso8601(const timestamp_milliseconds_t timestamp);

/// Inverse of to_iso8601; accepts exactly the form it produces.
std::optional<timestamp_milliseconds_t> try_from_iso8601(
    const std::string_view text);

}  // namespace waybill::schema
