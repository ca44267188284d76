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

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cursor/batch_source.hpp"

namespace batchcursor::cursor {

/**
 * A `BatchSource` serving named collections held in memory, paginated the
 * way a server paginates a find command.
 *
 * The first batch holds `batch_size` documents (`kDefaultBatchSize` when
 * unset or zero), later batches hold `batch_size` documents or everything that
 * remains when unset or zero. The cursor id is zero as soon as a batch contains the last
 * matching document.
 *
 * Filters match by field equality. A filter value may also be an
 * `{"$eq": value}` document; any other field name starting with `$` is
 * rejected with `ServerException` code `kBadValueCode`.
 *
 * Thread safe.
 */
class InMemoryBatchSource final : public BatchSource {
 public:
  static constexpr uint32_t kDefaultBatchSize = 101;
  static constexpr int32_t kBadValueCode = 2;
  static constexpr int32_t kCursorNotFoundCode = 43;

  void Insert(const std::string &ns, std::vector<Document> documents);

  Batch FetchInitial(const Query &query, const CursorOptions &options, SessionHandle &session) override;
  Batch FetchMore(CursorId cursor_id, std::optional<uint32_t> batch_size, SessionHandle &session) override;
  void Kill(CursorId cursor_id, SessionHandle &session) override;

  size_t OpenCursors() const;
  bool IsOpen(CursorId cursor_id) const;
  std::vector<CursorId> KilledCursors() const;

  uint64_t InitialCalls() const { return initial_calls_.load(); }
  uint64_t MoreCalls() const { return more_calls_.load(); }
  uint64_t KillCalls() const { return kill_calls_.load(); }

 private:
  struct OpenCursor {
    std::vector<Document> documents;
    size_t position{0};
    uint64_t session_id{0};
  };

  Batch TakeBatch(CursorId cursor_id, OpenCursor &open_cursor, uint32_t limit);

  mutable std::mutex lock_;
  std::map<std::string, std::vector<Document>, std::less<>> collections_;
  std::unordered_map<CursorId, OpenCursor> open_cursors_;
  std::vector<CursorId> killed_cursors_;
  int64_t next_cursor_id_{1};

  std::atomic<uint64_t> initial_calls_{0};
  std::atomic<uint64_t> more_calls_{0};
  std::atomic<uint64_t> kill_calls_{0};
};

}  // namespace batchcursor::cursor
