#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace autoproof::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

// Specialized beside each enum with a textual form; exposes `kNames`.
template <typename Enum>
struct enum_names;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> find_enum_value(
    const std::array<enum_name_t<Enum>, N>& names,
    const std::string_view name) {
  auto it = std::find_if(std::begin(names), std::end(names),
                         [&](const auto& entry) { return entry.first == name; });
  if (it == std::end(names)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::string_view find_enum_name(
    const std::array<enum_name_t<Enum>, N>& names,
    const Enum value) {
  auto it =
      std::find_if(std::begin(names), std::end(names),
                   [&](const auto& entry) { return entry.second == value; });
  return it == std::end(names) ? std::string_view{"unknown"} : it->first;
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  return find_enum_value(enum_names<Enum>::kNames, name);
}

}  // namespace autoproof::schema
