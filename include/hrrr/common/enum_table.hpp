#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/common/internal_error.hpp"

namespace hrrr::common {

// One row of a closed enumeration's string mapping.
template <typename E>
struct EnumName {
  E value;
  std::string_view name;
};

template <typename E, std::size_t N>
constexpr auto FindEnumByName(
    const std::array<EnumName<E>, N>& table, std::string_view name)
    -> std::optional<E> {
  for (const auto& entry : table) {
    if (entry.name == name) {
      return entry.value;
    }
  }
  return std::nullopt;
}

template <typename E, std::size_t N>
constexpr auto FindNameOfEnum(
    const std::array<EnumName<E>, N>& table, E value)
    -> std::optional<std::string_view> {
  for (const auto& entry : table) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return std::nullopt;
}

// Exhaustive string -> enum lookup. Fails with kInvalidEnum on no match.
template <typename E, std::size_t N>
auto ParseEnum(const std::array<EnumName<E>, N>& table, std::string_view name)
    -> Result<E> {
  if (auto value = FindEnumByName(table, name)) {
    return *value;
  }
  return std::unexpected(
      Diagnostic::InvalidEnum(
          fmt::format("Could not parse value from string: {}", name)));
}

// enum -> string. Every enumerator is listed in its table, so a miss means
// the value was forged (e.g. static_cast from an out-of-range integer).
template <typename E, std::size_t N>
auto EnumToString(
    const std::array<EnumName<E>, N>& table, E value, const char* context)
    -> std::string_view {
  if (auto name = FindNameOfEnum(table, value)) {
    return *name;
  }
  ThrowInternalError(
      context,
      fmt::format("enum value {} has no name", static_cast<int>(value)));
}

}  // namespace hrrr::common
