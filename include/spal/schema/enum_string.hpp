#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace spal::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

/// Name table for `Enum`. Each enum that crosses a text boundary specializes
/// this with a `static constexpr std::array<enum_name_t<Enum>, N> kNames`.
/// Enums without a table fail to compile rather than silently report no name.
template <typename Enum>
struct enum_names;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_name_t<Enum>, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  return from_string(value, enum_names<Enum>::kNames);
}

/// Table name of `value`, or "unknown" for a value outside the table.
template <typename Enum>
constexpr std::string_view name_of(const Enum value) {
  return to_string(value, enum_names<Enum>::kNames).value_or("unknown");
}

}  // namespace spal::schema
