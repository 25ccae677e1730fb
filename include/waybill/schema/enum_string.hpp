#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace waybill::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Every wire name of a mapping table joined by separator (CLI help text).
template <typename Enum, std::size_t N>
std::string join_names(
    const std::array<std::pair<std::string_view, Enum>, N>& mappings,
    const std::string_view separator) {
  auto joined = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    static_cast<void>(enum_value);
    if (!joined.empty()) {
      joined.append(separator);
    }
    joined.append(name);
  }
  return joined;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace waybill::schema
