#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums, used for CLI text and log output.
namespace ledgersync::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
using enum_names_t = std::array<enum_name_t<Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_names_t<Enum, N>& names) {
  auto it = std::ranges::find(names, value, &enum_name_t<Enum>::first);
  if (it == std::end(names)) {
    return std::nullopt;
  }
  return it->second;
}

/// Name of `value`, or `fallback` for a value missing from the table.
template <typename Enum, std::size_t N>
constexpr std::string_view to_string(const Enum value,
                                     const enum_names_t<Enum, N>& names,
                                     const std::string_view fallback) {
  auto it = std::ranges::find(names, value, &enum_name_t<Enum>::second);
  if (it == std::end(names)) {
    return fallback;
  }
  return it->first;
}

/// Parse an enum by name; specialized next to each enum that has a table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value) = delete;

}  // namespace ledgersync::schema
