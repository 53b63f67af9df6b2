#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Wire names of protocol enums. Each enum header declares a mapping table and
// specialises `try_from_string`/`to_string` on top of these lookups.
namespace icnp::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
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
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Every wire name of a table, in table order, separated by `separator`.
template <typename Enum, std::size_t N>
std::string names_of(const std::array<enum_mapping_t<Enum>, N>& mappings,
                     const std::string_view separator = ", ") {
  auto result = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!result.empty()) {
      result.append(separator);
    }
    result.append(name);
  }
  return result;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace icnp::schema
