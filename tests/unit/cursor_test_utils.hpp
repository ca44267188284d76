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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cursor/cursor.hpp"
#include "cursor/in_memory_source.hpp"
#include "cursor/session.hpp"
#include "cursor/value.hpp"

namespace batchcursor::test {

inline std::vector<cursor::Document> MakeDocuments(int64_t count) {
  std::vector<cursor::Document> documents;
  documents.reserve(count);
  for (int64_t i = 0; i < count; ++i) {
    documents.push_back(cursor::Document{{"_id", i}, {"value", i * 10}});
  }
  return documents;
}

inline std::vector<cursor::Value> AsValues(std::vector<cursor::Document> documents) {
  std::vector<cursor::Value> values;
  values.reserve(documents.size());
  for (auto &document : documents) values.emplace_back(std::move(document));
  return values;
}

/// Cursor tests run against a collection `test.docs` filled with `documents`
/// documents `{_id: i, value: 10 * i}`.
class CursorTest : public ::testing::Test {
 protected:
  static constexpr const char *kNs = "test.docs";

  void Fill(int64_t documents) { source_.Insert(kNs, MakeDocuments(documents)); }

  std::unique_ptr<cursor::Cursor> MakeCursor(std::optional<uint32_t> batch_size = std::nullopt,
                                             cursor::Document filter = {}) {
    return std::make_unique<cursor::Cursor>(&source_, &sessions_, cursor::Query{.ns = kNs, .filter = std::move(filter)},
                                            cursor::CursorOptions{.batch_size = batch_size});
  }

  cursor::InMemoryBatchSource source_;
  cursor::ImplicitSessionManager sessions_;
};

}  // namespace batchcursor::test
