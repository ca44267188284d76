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


#include "flags/log_level.hpp"

#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to the log file.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Path to where the log should be stored.");

namespace {

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format(
    "Minimum log level. Allowed values: {}", batchcursor::utils::GetAllowedEnumValuesString(log_level_mappings));

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return batchcursor::flags::ValidLogLevel(value); });

namespace batchcursor::flags {

bool ValidLogLevel(std::string_view value) {
  if (const auto result = utils::IsValidEnumValueString(value, log_level_mappings); !result) {
    switch (result.error()) {
      case utils::ValidationError::EmptyValue: {
        std::cout << "Log level cannot be empty." << std::endl;
        break;
      }
      case utils::ValidationError::InvalidValue: {
        std::cout << "Invalid value for log level. Allowed values: "
                  << utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
        break;
      }
    }
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value) {
  return utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

namespace {

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = LogLevelToEnum(FLAGS_log_level);
  BC_ASSERT(log_level, "Invalid log level {}", FLAGS_log_level);
  return *log_level;
}

}  // namespace

void InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;

  // The stderr sink stays at the front so LogToStderr can toggle it.
  sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  sinks.back()->set_level(spdlog::level::off);

  if (!FLAGS_log_file.empty()) {
    sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(FLAGS_log_file));
  } else {
    // Without a log file stderr is the only destination.
    FLAGS_also_log_to_stderr = true;
  }

  const auto log_level = ParseLogLevel();
  auto logger = std::make_shared<spdlog::logger>("batchcursor_log", sinks.begin(), sinks.end());
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));

  if (FLAGS_also_log_to_stderr) LogToStderr(log_level);
}

// NOTE: the default logger itself is not swapped here, only the level of its
// first sink which is atomic.
void LogToStderr(spdlog::level::level_enum log_level) {
  auto default_logger = spdlog::default_logger();
  auto sink = default_logger->sinks().front();
  sink->set_level(log_level);
}

}  // namespace batchcursor::flags
