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


/// @file
/// Root of the project's exception hierarchy.
#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace batchcursor::utils {

/// Overrides `name()` with the class name, for logging caught exceptions.
#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/**
 * Exception carrying a preformatted message. Every exception thrown by the
 * library derives from it, so callers can catch a single type and still log
 * something useful through `what()` and `name()`.
 */
class BasicException : public std::exception {
 public:
  explicit BasicException(std::string_view message) noexcept : msg_(message) {}
  explicit BasicException(const char *message) noexcept : msg_(message) {}
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  /// Formats the message with fmt, e.g. `BasicException("cursor {} not found", id)`.
  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  ~BasicException() override = default;

  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

}  // namespace batchcursor::utils
