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
///
/// Convenience macros which wrap defining a command line flag with a
/// validation function. They can only be used in tandem with gflags.
///
/// @code
/// DEFINE_VALIDATED_uint64(cursor_batch_size, 0, "Documents per fetch", FLAG_IN_RANGE(0, 1000000));
/// @endcode
///
/// Note that the `value` is implicitly bound to the new value of the flag. Name
/// of the flag as a string is implicitly bound to the `flagname` variable.

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

/// Macro which defines a flag of given type and registers a validator function.
/// The function is generated from the `validation_body` and `cpp_type` is used
/// as the type of the implicitly bound `value`.
#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

#define DEFINE_VALIDATED_uint64(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(uint64, flag_name, default_value, description, std::uint64_t, validation_body)

#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)

/// General flag validator for numeric flag values inside a range (inclusive).
///
/// This should only be used with DEFINE_VALIDATED_* macros.
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                                \
  {                                                                                                            \
    if (value >= lower_bound && value <= upper_bound) return true;                                             \
    std::cout << "Expected --" << flagname << " to be in range [" << lower_bound << ", " << upper_bound << "]" \
              << std::endl;                                                                                    \
    return false;                                                                                              \
  }

/// Flag validator for strings which must not be empty.
#define FLAG_NOT_EMPTY()                                                    \
  {                                                                         \
    if (!value.empty()) return true;                                        \
    std::cout << "Expected --" << flagname << " to be nonempty" << std::endl; \
    return false;                                                           \
  }
