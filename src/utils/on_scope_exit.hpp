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
#include <type_traits>
#include <utility>

namespace batchcursor::utils {

/**
 * Runs a callable when the enclosing scope is left, whether normally or by an
 * exception. Used to release per-call state such as a busy flag:
 *
 *   running = true;
 *   OnScopeExit reset_running{[&running] { running = false; }};
 *   // pull documents, may throw
 */
template <typename Callable>
class [[nodiscard]] OnScopeExit {
 public:
  template <typename U>
  requires std::constructible_from<Callable, U>
  explicit OnScopeExit(U &&callable) : callable_(std::forward<U>(callable)) {}

  OnScopeExit(const OnScopeExit &) = delete;
  OnScopeExit(OnScopeExit &&) = delete;
  OnScopeExit &operator=(const OnScopeExit &) = delete;
  OnScopeExit &operator=(OnScopeExit &&) = delete;

  ~OnScopeExit() {
    if (armed_) callable_();
  }

  /// The callable won't run.
  void Disable() { armed_ = false; }

 private:
  Callable callable_;
  bool armed_{true};
};

template <typename Callable>
OnScopeExit(Callable &&) -> OnScopeExit<std::decay_t<Callable>>;

}  // namespace batchcursor::utils
