#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tentacle::schema {

/// Name table for an enum; specializations expose `kMappings`, an array of
/// (name, value) pairs.
template <typename Enum>
struct enum_names;

template <typename Enum>
concept named_enum = std::is_enum_v<Enum> && requires {
  enum_names<Enum>::kMappings;
};

template <named_enum Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <named_enum Enum>
constexpr std::string_view to_string(const Enum value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::kMappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

/// Name of a raw result code as carried in a call or query envelope.
template <named_enum Enum>
constexpr std::string_view code_name(const uint32_t code) {
  return to_string(static_cast<Enum>(code));
}

}  // namespace tentacle::schema
