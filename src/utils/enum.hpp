// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

/// @file
/// Helpers over constexpr arrays of `std::pair{"NAME"sv, Enum::Value}`, used to
/// parse enum-valued flags and to print enums.

namespace batchcursor::utils {

enum class ValidationError : uint8_t { EmptyValue, InvalidValue };

namespace detail {

auto FindByName(const auto &mappings, const auto &name) {
  return std::find_if(mappings.begin(), mappings.end(), [&](const auto &mapping) { return mapping.first == name; });
}

}  // namespace detail

/// "A, B, C" listing every name in `mappings`, for help strings and errors.
std::string GetAllowedEnumValuesString(const auto &mappings) {
  std::string allowed;
  for (const auto &[name, value] : mappings) {
    if (!allowed.empty()) allowed += ", ";
    allowed += name;
  }
  return allowed;
}

std::expected<void, ValidationError> IsValidEnumValueString(const auto &name, const auto &mappings) {
  if (name.empty()) return std::unexpected{ValidationError::EmptyValue};
  if (detail::FindByName(mappings, name) == mappings.end()) return std::unexpected{ValidationError::InvalidValue};
  return {};
}

template <typename Enum>
std::optional<Enum> StringToEnum(const auto &name, const auto &mappings) {
  if (auto it = detail::FindByName(mappings, name); it != mappings.end()) return it->second;
  return std::nullopt;
}

template <typename Enum>
requires std::is_enum_v<Enum>
std::optional<std::string_view> EnumToString(Enum value, const auto &mappings) {
  const auto it =
      std::find_if(mappings.begin(), mappings.end(), [value](const auto &mapping) { return mapping.second == value; });
  if (it == mappings.end()) [[unlikely]] return std::nullopt;
  return it->first;
}

}  // namespace batchcursor::utils
