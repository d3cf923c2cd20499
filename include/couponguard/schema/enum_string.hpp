#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Each enum header owns one
// std::array<enum_mapping_t<Enum>, N>; lookups are linear, tables are tiny.
namespace couponguard::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& mapping : mappings) {
    if (mapping.first == name) {
      return mapping.second;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& mapping : mappings) {
    if (mapping.second == value) {
      return mapping.first;
    }
  }
  return std::nullopt;
}

/// Parse an operator-facing name. Only enums accepted on the command line
/// specialize this; names are case sensitive.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace couponguard::schema
