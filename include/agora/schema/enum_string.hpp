#pragma once

#include <optional>
#include <string_view>
#include <utility>

namespace agora::schema {

/// Wire names of a schema enum.  Each specialization lists every enumerator
/// once in `entries`, as name/value pairs.
template <typename Enum>
struct enum_names;

template <typename Enum>
using enum_entry_t = std::pair<std::string_view, Enum>;

/// Enumerator named `value`, or std::nullopt for names the table lacks.
template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, entry] : enum_names<Enum>::entries) {
    if (name == value) {
      return entry;
    }
  }
  return std::nullopt;
}

/// Name of `value`; "unknown" for values decoded from out of range bytes.
template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  for (const auto& [name, entry] : enum_names<Enum>::entries) {
    if (entry == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace agora::schema
