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


#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <stdexcept>

#include "utils/on_scope_exit.hpp"

using batchcursor::utils::OnScopeExit;

TEST(OnScopeExit, BasicUsage) {
  int variable = 1;
  {
    ASSERT_EQ(variable, 1);
    OnScopeExit on_exit([&variable] { variable = 2; });
    EXPECT_EQ(variable, 1);
  }
  EXPECT_EQ(variable, 2);
}

TEST(OnScopeExit, RunsWhenUnwinding) {
  bool busy = true;
  auto pull = [&busy] {
    OnScopeExit reset([&busy] { busy = false; });
    throw std::runtime_error("fetch failed");
  };
  EXPECT_THROW(pull(), std::runtime_error);
  EXPECT_FALSE(busy);
}

TEST(OnScopeExit, Disable) {
  int calls = 0;
  {
    OnScopeExit on_exit([&calls] { ++calls; });
    on_exit.Disable();
  }
  EXPECT_EQ(calls, 0);
}
