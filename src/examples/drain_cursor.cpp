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


// Fills an in-memory collection and consumes it through every cursor
// interface, printing what each one produced.

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "gflags/gflags.h"

#include "cursor/cursor.hpp"
#include "cursor/cursor_stream.hpp"
#include "cursor/in_memory_source.hpp"
#include "flags/cursor.hpp"
#include "flags/log_level.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"
#include "utils/thread_pool.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(documents, 10, "Number of documents inserted into the collection.", FLAG_IN_RANGE(0, 100000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(collection, "test.cursor", "Namespace of the collection.", FLAG_NOT_EMPTY());

namespace {

using batchcursor::cursor::Cursor;
using batchcursor::cursor::Document;
using batchcursor::cursor::Value;

Value Doubled(Value value) {
  auto &document = value.ValueDocument();
  document.Set("value", document.At("value").ValueInt() * 2);
  return value;
}

void PrintAll(const std::string &title, const std::vector<Value> &values) {
  std::cout << title << " (" << values.size() << "):";
  for (const auto &value : values) std::cout << ' ' << value;
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage("Drains an in-memory collection through a batched cursor.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  batchcursor::flags::InitializeLogger();

  batchcursor::cursor::InMemoryBatchSource source;
  batchcursor::cursor::ImplicitSessionManager sessions;

  std::vector<Document> documents;
  documents.reserve(FLAGS_documents);
  for (uint64_t i = 0; i < FLAGS_documents; ++i) {
    documents.push_back(Document{{"_id", static_cast<int64_t>(i)}, {"value", static_cast<int64_t>(i)}});
  }
  source.Insert(FLAGS_collection, std::move(documents));

  const batchcursor::cursor::Query query{.ns = FLAGS_collection, .filter = {}};
  const auto options = batchcursor::flags::CursorOptionsFromFlags();

  try {
    {
      Cursor cursor(&source, &sessions, query, options);
      cursor.Map(Doubled);
      PrintAll("ToArray", cursor.ToArray());
    }

    {
      Cursor cursor(&source, &sessions, query, options);
      std::vector<Value> values;
      cursor.ForEach([&values](Value &value) { values.push_back(std::move(value)); });
      PrintAll("ForEach", values);
    }

    {
      Cursor cursor(&source, &sessions, query, options);
      std::vector<Value> values;
      for (const auto &value : cursor) values.push_back(value);
      PrintAll("range for", values);
    }

    {
      Cursor cursor(&source, &sessions, query, options);
      std::vector<Value> values;
      while (cursor.HasNext()) {
        if (auto value = cursor.Next()) values.push_back(std::move(*value));
      }
      PrintAll("HasNext/Next", values);
    }

    {
      Cursor cursor(&source, &sessions, query, options);
      std::vector<Value> values;
      auto stream = cursor.Stream();
      stream->OnData([&values](const Value &value) { values.push_back(value); })
          .OnError([](std::exception_ptr error) {
            try {
              std::rethrow_exception(error);
            } catch (const std::exception &e) {
              spdlog::error("Stream failed: {}", e.what());
            }
          });
      batchcursor::utils::ThreadPool pool(1);
      stream->RunAsync(pool).Get();
      PrintAll("stream", values);
    }
  } catch (const std::exception &e) {
    spdlog::critical("Draining {} failed: {}", FLAGS_collection, e.what());
    return 1;
  }

  BC_ASSERT(sessions.ActiveSessions() == 0, "{} sessions were left active", sessions.ActiveSessions());
  std::cout << "Sessions started: " << sessions.StartedSessions() << ", open server cursors: " << source.OpenCursors()
            << std::endl;
  return 0;
}
