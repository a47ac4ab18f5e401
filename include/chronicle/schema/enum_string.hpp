#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Stable string names for enums that appear in logs and tool output. Each
// enum keeps its name table next to its declaration and specialises
// try_from_string with it.
namespace chronicle::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto it = std::ranges::find(names, value, &enum_name_t<Enum>::first);
  if (it == std::end(names)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto it = std::ranges::find(names, value, &enum_name_t<Enum>::second);
  if (it == std::end(names)) {
    return std::nullopt;
  }
  return it->first;
}

/// Parse a name produced by to_string. Only the specialisations exist.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

}  // namespace chronicle::schema
