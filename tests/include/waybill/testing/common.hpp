#pragma once

#include <waybill/blake3/hash.hpp>
#include <waybill/schema/encoding/json/encoder.hpp>
#include <waybill/schema/log_frame.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/shipment_event.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace waybill::testing {

using json_encoder_t = waybill::schema::encoding::json_encoder_t;

inline std::string make_data_dir(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(sequence++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Deterministic clock advancing only when told to.
class manual_clock final {
 public:
  explicit manual_clock(
      const waybill::schema::timestamp_milliseconds_t start = 1'767'225'600'000)
      : now_{start} {}

  waybill::schema::timestamp_milliseconds_t now() const { return now_; }
  void advance(const waybill::schema::timestamp_milliseconds_t millis) {
    now_ += millis;
  }
  void set(const waybill::schema::timestamp_milliseconds_t millis) {
    now_ = millis;
  }

  waybill::schema::clock_function_t function() {
    return [this] { return now_.load(); };
  }

 private:
  std::atomic<waybill::schema::timestamp_milliseconds_t> now_;
};

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  auto lines = std::vector<std::string>{};
  auto line = std::string{};
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

inline void write_lines(const std::filesystem::path& path,
                        const std::vector<std::string>& lines) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  for (const auto& line : lines) {
    out << line << '\n';
  }
}

inline void append_raw(const std::filesystem::path& path,
                       const std::string_view text) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::app};
  out << text;
}

inline std::string to_text(const waybill::schema::bytes_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

inline waybill::schema::log_frame_t decode_frame(const std::string& line) {
  auto bytes = waybill::schema::make_bytes(line);
  return json_encoder_t{}.decode<waybill::schema::log_frame_t>(
      waybill::schema::make_bytes_view(bytes));
}

/// Decode the event stored on line `index` (0-based) of an append-file event
/// log.
inline waybill::schema::shipment_event_t read_logged_event(
    const std::filesystem::path& path,
    const std::size_t index) {
  auto frame = decode_frame(read_lines(path).at(index));
  return json_encoder_t{}.decode<waybill::schema::shipment_event_t>(
      waybill::schema::make_bytes_view(frame.record));
}

/// Rewrite the event on line `index` of an append-file event log in place.
///
/// With `rechain` set every digest from that line onwards is recomputed, so
/// only the lifecycle rules can expose the edit.
inline void tamper_event(
    const std::filesystem::path& path,
    const std::size_t index,
    const std::function<void(waybill::schema::shipment_event_t&)>& edit,
    const bool rechain) {
  auto encoder = json_encoder_t{};
  auto lines = read_lines(path);
  auto previous = waybill::schema::make_zero_hash();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto frame = decode_frame(lines[i]);
    if (i == index) {
      auto event = encoder.decode<waybill::schema::shipment_event_t>(
          waybill::schema::make_bytes_view(frame.record));
      edit(event);
      frame.record = encoder.encode(event);
    }
    if (rechain && i >= index) {
      frame.digest = waybill::blake3::chain(
          previous, waybill::schema::make_bytes_view(frame.record));
    }
    previous = frame.digest;
    lines[i] = to_text(encoder.encode(frame));
  }
  write_lines(path, lines);
}

/// Append a correctly chained frame wrapping an arbitrary JSON record, as a
/// writer with a newer record schema would.
inline void append_frame(const std::filesystem::path& path,
                         const nlohmann::json& record) {
  auto lines = read_lines(path);
  auto previous = waybill::schema::make_zero_hash();
  auto position = uint64_t{1};
  if (!lines.empty()) {
    auto last = decode_frame(lines.back());
    previous = last.digest;
    position = last.position + 1;
  }

  auto frame = waybill::schema::log_frame_t{};
  frame.position = position;
  frame.record = waybill::schema::make_bytes(record.dump());
  frame.digest = waybill::blake3::chain(
      previous, waybill::schema::make_bytes_view(frame.record));
  append_raw(path, to_text(json_encoder_t{}.encode(frame)) + "\n");
}

}  // namespace waybill::testing
