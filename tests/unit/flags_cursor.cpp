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


#include <gtest/gtest.h>

#include "gflags/gflags.h"

#include "flags/cursor.hpp"
#include "flags/log_level.hpp"

class CursorFlagsTest : public ::testing::Test {
 protected:
  void TearDown() override { FLAGS_cursor_batch_size = 0; }
};

TEST_F(CursorFlagsTest, ZeroLeavesBatchSizeToTheServer) {
  FLAGS_cursor_batch_size = 0;
  EXPECT_FALSE(batchcursor::flags::CursorOptionsFromFlags().batch_size.has_value());
}

TEST_F(CursorFlagsTest, ExplicitBatchSize) {
  ASSERT_FALSE(gflags::SetCommandLineOption("cursor_batch_size", "250").empty());
  EXPECT_EQ(batchcursor::flags::CursorOptionsFromFlags().batch_size, 250U);
}

TEST_F(CursorFlagsTest, BatchSizeIsValidated) {
  EXPECT_TRUE(gflags::SetCommandLineOption("cursor_batch_size", "1000001").empty());
  EXPECT_EQ(FLAGS_cursor_batch_size, 0U);
}

TEST(LogLevelFlags, Validation) {
  EXPECT_TRUE(batchcursor::flags::ValidLogLevel("TRACE"));
  EXPECT_TRUE(batchcursor::flags::ValidLogLevel("CRITICAL"));
  EXPECT_FALSE(batchcursor::flags::ValidLogLevel(""));
  EXPECT_FALSE(batchcursor::flags::ValidLogLevel("trace"));
  EXPECT_EQ(batchcursor::flags::LogLevelToEnum("WARNING"), spdlog::level::warn);
  EXPECT_FALSE(batchcursor::flags::LogLevelToEnum("VERBOSE").has_value());
}

TEST(LogLevelFlags, LogLevelIsValidated) {
  EXPECT_TRUE(gflags::SetCommandLineOption("log_level", "LOUD").empty());
  EXPECT_EQ(FLAGS_log_level, "WARNING");
}
