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

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "cursor/value.hpp"

namespace batchcursor::cursor {

/// A user mapping function. An empty optional means "no value" and is never a
/// legitimate result.
using Transform = std::function<std::optional<Value>(Value)>;

/// Adapts any callable taking a `Value` into a `Transform`. Callables returning
/// something convertible to `Value` can never produce "no value"; callables
/// returning `std::optional<Value>` (or `std::nullopt`) can.
template <typename TFunc>
requires std::invocable<TFunc &, Value>
Transform MakeTransform(TFunc &&func) {
  using Result = std::remove_cvref_t<std::invoke_result_t<TFunc &, Value>>;
  if constexpr (std::is_same_v<Result, std::optional<Value>>) {
    return Transform(std::forward<TFunc>(func));
  } else if constexpr (std::is_same_v<Result, std::nullopt_t>) {
    return [func = std::forward<TFunc>(func)](Value value) mutable -> std::optional<Value> {
      return func(std::move(value));
    };
  } else {
    static_assert(std::is_convertible_v<Result, Value>, "A cursor transform must return a Value");
    return [func = std::forward<TFunc>(func)](Value value) mutable -> std::optional<Value> {
      return Value(func(std::move(value)));
    };
  }
}

/**
 * Ordered list of transforms applied lazily to every document a cursor
 * produces. Each transform receives the previous transform's output.
 */
class TransformChain {
 public:
  void Append(Transform transform) { transforms_.push_back(std::move(transform)); }

  bool empty() const { return transforms_.empty(); }
  size_t size() const { return transforms_.size(); }

  /**
   * Runs `document` through every transform in registration order.
   *
   * @throws InvalidTransformResultException when a transform produces no value
   * Exceptions thrown by the transforms themselves propagate unchanged.
   */
  Value Apply(Document document) const;

 private:
  std::vector<Transform> transforms_;
};

}  // namespace batchcursor::cursor
