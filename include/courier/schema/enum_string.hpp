#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Enum <-> name tables used for config values, error names in transaction
// results and event attributes. Each enum header owns a constexpr table and
// specializes try_from_string against it.
namespace courier::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto it = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto it = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::second);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

/// "a | b | c", for diagnostics listing the accepted names.
template <typename Enum, std::size_t N>
std::string describe_names(
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto out = std::string{};
  for (const auto& [name, value] : mappings) {
    if (!out.empty()) {
      out += " | ";
    }
    out += name;
  }
  return out;
}

template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value) = delete;

}  // namespace courier::schema
