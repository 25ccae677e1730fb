#pragma once
#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waybill::storage {

/// Independent append-only streams kept by every backend.
enum class log_channel : uint8_t { events = 0, counters = 1 };

/// One raw record read back from a durable log, in append order.
struct log_entry final {
  /// 1-based position of the record within its channel.
  uint64_t ordinal{};
  /// Record bytes; std::nullopt when the stored form could not be read back.
  std::optional<waybill::schema::bytes_t> bytes;
  /// The record was the unterminated tail of the log (torn write).
  bool truncated{};
  std::string error;
};

// Every specialization names the codec its records are written with as
// `encoder_t`.
template <typename Library>
struct storage {
  /// Durably append one record to channel. Returns false, leaving no partial
  /// record behind, when the write could not be completed.
  bool append(log_channel channel,
              const waybill::schema::bytes_view_t& record);

  /// Read every record of channel in append order, or std::nullopt when the
  /// channel itself cannot be read.
  std::optional<std::vector<log_entry>> read(log_channel channel) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace waybill::storage
