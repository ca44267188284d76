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

#include <cstdint>
#include <functional>

#include <fmt/format.h>

namespace batchcursor::cursor {

/// Server-assigned handle of a paginated result set. Zero denotes that the
/// server holds no live resource for the result set.
class CursorId {
 public:
  constexpr CursorId() = default;
  explicit constexpr CursorId(int64_t id) : id_(id) {}

  static constexpr CursorId Zero() { return CursorId{}; }

  constexpr bool IsZero() const { return id_ == 0; }
  constexpr int64_t AsInt() const { return id_; }

  friend constexpr bool operator==(CursorId a, CursorId b) = default;

 private:
  int64_t id_{0};
};

}  // namespace batchcursor::cursor

template <>
struct fmt::formatter<batchcursor::cursor::CursorId> : fmt::formatter<int64_t> {
  auto format(batchcursor::cursor::CursorId id, format_context &ctx) const {
    return fmt::formatter<int64_t>::format(id.AsInt(), ctx);
  }
};

template <>
struct std::hash<batchcursor::cursor::CursorId> {
  size_t operator()(batchcursor::cursor::CursorId id) const noexcept { return std::hash<int64_t>{}(id.AsInt()); }
};
