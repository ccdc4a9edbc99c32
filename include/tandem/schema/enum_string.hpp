#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tandem::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Name table for an enum; specializations expose `static constexpr
/// kMappings` listing every valid value once.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

/// Wire value back to an enum, or std::nullopt when it names no known value.
template <typename Enum>
constexpr std::optional<Enum> try_from_underlying(
    const std::underlying_type_t<Enum> raw) {
  for (const auto& entry : enum_names<Enum>::kMappings) {
    if (static_cast<std::underlying_type_t<Enum>>(entry.second) == raw) {
      return entry.second;
    }
  }
  return std::nullopt;
}

}  // namespace tandem::schema
