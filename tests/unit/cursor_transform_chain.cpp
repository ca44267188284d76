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


#include <optional>
#include <stdexcept>

#include <gtest/gtest.h>

#include "cursor/exceptions.hpp"
#include "cursor/transform_chain.hpp"

using batchcursor::cursor::Document;
using batchcursor::cursor::InvalidTransformResultException;
using batchcursor::cursor::MakeTransform;
using batchcursor::cursor::TransformChain;
using batchcursor::cursor::Value;

TEST(TransformChain, EmptyChainWrapsTheDocument) {
  TransformChain chain;
  EXPECT_TRUE(chain.empty());
  EXPECT_EQ(chain.Apply(Document{{"a", 1}}), Value(Document{{"a", 1}}));
}

TEST(TransformChain, AppliesInRegistrationOrder) {
  TransformChain chain;
  chain.Append(MakeTransform([](Value value) { return value.ValueDocument().At("a"); }));
  chain.Append(MakeTransform([](Value value) { return value.ValueInt() + 1; }));
  chain.Append(MakeTransform([](Value value) { return value.ValueInt() * 10; }));
  ASSERT_EQ(chain.size(), 3);
  EXPECT_EQ(chain.Apply(Document{{"a", 1}}), Value(20));
}

TEST(TransformChain, NullIsAValidResult) {
  TransformChain chain;
  chain.Append(MakeTransform([](Value) { return Value(); }));
  chain.Append(MakeTransform([](Value value) -> std::optional<Value> { return value; }));
  EXPECT_TRUE(chain.Apply(Document{}).IsNull());
}

TEST(TransformChain, NoValueIsRejectedWithTheTransformIndex) {
  TransformChain chain;
  chain.Append(MakeTransform([](Value value) { return value; }));
  chain.Append(MakeTransform([](Value) { return std::nullopt; }));
  bool called_after = false;
  chain.Append(MakeTransform([&called_after](Value value) {
    called_after = true;
    return value;
  }));

  try {
    chain.Apply(Document{});
    FAIL() << "Expected InvalidTransformResultException";
  } catch (const InvalidTransformResultException &e) {
    EXPECT_NE(std::string(e.what()).find("#1"), std::string::npos) << e.what();
  }
  EXPECT_FALSE(called_after);
}

TEST(TransformChain, ExceptionsPropagateUnchanged) {
  struct Boom : std::runtime_error {
    Boom() : std::runtime_error("boom") {}
  };
  TransformChain chain;
  chain.Append(MakeTransform([](Value) -> Value { throw Boom(); }));
  EXPECT_THROW(chain.Apply(Document{}), Boom);
}
