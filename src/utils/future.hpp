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
/// @file

#include <chrono>
#include <future>

namespace batchcursor::utils {

/// Wraps an `std::future` object to ensure that upon destruction the
/// `std::future` is waited on.
template <typename TResult>
class Future {
 public:
  Future() = default;
  explicit Future(std::future<TResult> future) : future_(std::move(future)) {}

  Future(const Future &) = delete;
  Future(Future &&) noexcept = default;
  Future &operator=(const Future &) = delete;
  Future &operator=(Future &&) noexcept = default;

  ~Future() {
    if (future_.valid()) future_.wait();
  }

  /// Returns true if the result (or the exception) is available. The behaviour
  /// is undefined if the future isn't valid.
  bool IsReady() const { return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }

  /// Blocks for at most `timeout`, returns whether the result became available.
  template <typename TRep, typename TPeriod>
  bool WaitFor(const std::chrono::duration<TRep, TPeriod> &timeout) const {
    return future_.wait_for(timeout) == std::future_status::ready;
  }

  /// Rethrows the exception stored by the producer, if any.
  TResult Get() { return future_.get(); }
  void Wait() const { future_.wait(); }
  bool IsValid() const { return future_.valid(); }

 private:
  std::future<TResult> future_;
};

/// Creates a `Future` from the given `std::future`.
template <typename TResult>
Future<TResult> MakeFuture(std::future<TResult> future) {
  return Future<TResult>(std::move(future));
}

}  // namespace batchcursor::utils
