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

#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "gflags/gflags.h"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(log_level);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_bool(also_log_to_stderr);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(log_file);

namespace batchcursor::flags {

bool ValidLogLevel(std::string_view value);
std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value);

/// Replaces the default logger according to `--log_level`, `--log_file` and
/// `--also_log_to_stderr`. Must be called after the flags are parsed.
void InitializeLogger();
void LogToStderr(spdlog::level::level_enum log_level);

}  // namespace batchcursor::flags
