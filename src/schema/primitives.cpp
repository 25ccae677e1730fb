#include <waybill/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <charconv>
#include <chrono>
#include <ctime>
#include <iterator>
#include <string_view>
#include <system_error>

namespace waybill::schema {

namespace {

std::optional<uint8_t> hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'f') {
    return static_cast<uint8_t>(ch - 'a' + 10);
  }
  if (ch >= 'A' && ch <= 'F') {
    return static_cast<uint8_t>(ch - 'A' + 10);
  }
  return std::nullopt;
}

// Unsigned decimal field of exactly `length` digits starting at `offset`.
std::optional<unsigned> parse_field(const std::string_view text,
                                    const size_t offset,
                                    const size_t length) {
  auto value = 0u;
  auto field = text.substr(offset, length);
  auto [end, error] =
      std::from_chars(field.data(), field.data() + field.size(), value);
  if (error != std::errc{} || end != field.data() + field.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    fmt::format_to(std::back_inserter(out), "{:02x}", byte);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view encoded) {
  if (encoded.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(encoded.size() / 2);
  for (auto i = size_t{0}; i < encoded.size(); i += 2) {
    auto high = hex_digit(encoded[i]);
    auto low = hex_digit(encoded[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

bool is_valid_utf8(const std::string_view bytes) {
  auto i = size_t{0};
  while (i < bytes.size()) {
    auto lead = static_cast<uint8_t>(bytes[i]);
    auto length = size_t{0};
    auto code_point = uint32_t{0};
    if (lead < 0x80u) {
      ++i;
      continue;
    } else if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
    } else {
      return false;
    }
    if (i + length > bytes.size()) {
      return false;
    }
    for (auto k = size_t{1}; k < length; ++k) {
      auto continuation = static_cast<uint8_t>(bytes[i + k]);
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (continuation & 0x3Fu);
    }
    constexpr auto kMinimum = std::array<uint32_t, 5>{0, 0, 0x80, 0x800, 0x10000};
    if (code_point < kMinimum[length] || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

clock_function_t system_clock() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

std::string to_iso8601(const timestamp_milliseconds_t timestamp) {
  auto seconds = static_cast<std::time_t>(timestamp / 1000);
  auto millis = static_cast<unsigned>(timestamp % 1000);
  auto utc = std::tm{};
  gmtime_r(&seconds, &utc);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                     utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

std::optional<timestamp_milliseconds_t> try_from_iso8601(
    const std::string_view text) {
  // 2026-01-19T14:30:45.123Z
  if (text.size() != 24 || text[4] != '-' || text[7] != '-' ||
      text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
      text[19] != '.' || text[23] != 'Z') {
    return std::nullopt;
  }
  auto year = parse_field(text, 0, 4);
  auto month = parse_field(text, 5, 2);
  auto day = parse_field(text, 8, 2);
  auto hour = parse_field(text, 11, 2);
  auto minute = parse_field(text, 14, 2);
  auto second = parse_field(text, 17, 2);
  auto millis = parse_field(text, 20, 3);
  if (!year || !month || !day || !hour || !minute || !second || !millis ||
      *year < 1970 || *hour > 23 || *minute > 59 || *second > 59) {
    return std::nullopt;
  }

  auto date = std::chrono::year_month_day{
      std::chrono::year{static_cast<int>(*year)},
      std::chrono::month{*month}, std::chrono::day{*day}};
  if (!date.ok()) {
    return std::nullopt;
  }
  auto instant = std::chrono::sys_days{date} + std::chrono::hours{*hour} +
                 std::chrono::minutes{*minute} +
                 std::chrono::seconds{*second} +
                 std::chrono::milliseconds{*millis};
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          instant.time_since_epoch())
          .count());
}

}  // namespace waybill::schema
