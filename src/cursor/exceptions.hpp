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

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "utils/exceptions.hpp"

namespace batchcursor::cursor {

/**
 * @brief Base class of all exceptions raised by the cursor layer itself.
 */
class CursorException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CursorException)
};

/**
 * @brief Invalid use of the cursor API. Retrying the same call on the same
 * cursor fails again.
 */
class UsageException : public CursorException {
 public:
  using CursorException::CursorException;
  SPECIALIZE_GET_EXCEPTION_NAME(UsageException)
};

class ConcurrentPullException : public UsageException {
 public:
  ConcurrentPullException()
      : UsageException(
            "Cursor is already being iterated. A cursor supports a single consumer, concurrent pulls must be "
            "serialized by the caller.") {}
  SPECIALIZE_GET_EXCEPTION_NAME(ConcurrentPullException)
};

class InvalidTransformResultException : public UsageException {
 public:
  explicit InvalidTransformResultException(size_t transform_index)
      : UsageException(
            "Cursor transform #{} produced no value. Transforms must always return a value, use an explicit null "
            "value to represent an absent document.",
            transform_index) {}
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidTransformResultException)
};

class CursorInUseException : public UsageException {
 public:
  explicit CursorInUseException(std::string_view operation)
      : UsageException("Cannot call {} on a cursor which has already been initialized.", operation) {}
  SPECIALIZE_GET_EXCEPTION_NAME(CursorInUseException)
};

/**
 * @brief Raised when a killed cursor is pulled from. A cursor which ran out of
 * documents on its own keeps returning no value instead.
 */
class CursorExhaustedException : public UsageException {
 public:
  CursorExhaustedException() : UsageException("Cursor is exhausted, it was killed before all documents were read.") {}
  SPECIALIZE_GET_EXCEPTION_NAME(CursorExhaustedException)
};

/**
 * @brief Base class for failures of a `BatchSource`. The cursor never wraps
 * these, they reach the caller exactly as the source threw them.
 */
class UpstreamException : public CursorException {
 public:
  using CursorException::CursorException;
  SPECIALIZE_GET_EXCEPTION_NAME(UpstreamException)
};

/**
 * @brief The server rejected a command.
 */
class ServerException : public UpstreamException {
 public:
  template <class... Args>
  explicit ServerException(int32_t code, fmt::format_string<Args...> fmt, Args &&...args)
      : UpstreamException(fmt, std::forward<Args>(args)...), code_(code) {}

  int32_t code() const { return code_; }

  SPECIALIZE_GET_EXCEPTION_NAME(ServerException)

 private:
  int32_t code_;
};

/**
 * @brief The round trip to the server failed.
 */
class NetworkException : public UpstreamException {
 public:
  using UpstreamException::UpstreamException;
  SPECIALIZE_GET_EXCEPTION_NAME(NetworkException)
};

}  // namespace batchcursor::cursor
