#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Text names for the enums that appear in logs, events and CLI arguments.
// Each enum keeps one constexpr table of these pairs beside its definition.
namespace conduit::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::first);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found =
      std::ranges::find(mappings, value, &enum_mapping_t<Enum>::second);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

/// Specialised next to each enum that can be parsed from text.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view) {
  return std::nullopt;
}

}  // namespace conduit::schema
