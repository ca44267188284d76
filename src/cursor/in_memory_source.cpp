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

#include "cursor/in_memory_source.hpp"

#include <algorithm>
#include <limits>

#include "cursor/exceptions.hpp"
#include "utils/logging.hpp"

namespace batchcursor::cursor {

namespace {

void CheckSession(const SessionHandle &session) {
  if (session.HasEnded()) {
    throw UpstreamException("Cannot use session {} after it has ended.", session.Id());
  }
}

// Throws on every operator we don't understand, the same way a server
// rejects the whole command before returning a single document.
void ValidateFilter(const Document &filter) {
  for (const auto &[name, value] : filter) {
    if (name.starts_with('$')) {
      throw ServerException(InMemoryBatchSource::kBadValueCode, "unknown top level operator: {}", name);
    }
    if (!value.IsDocument()) continue;
    for (const auto &[op, operand] : value.ValueDocument()) {
      if (op.starts_with('$') && op != "$eq") {
        throw ServerException(InMemoryBatchSource::kBadValueCode, "unknown operator: {}", op);
      }
    }
  }
}

bool Matches(const Document &document, const Document &filter) {
  return std::all_of(filter.begin(), filter.end(), [&document](const auto &condition) {
    const auto &[name, expected] = condition;
    const auto *actual = document.Get(name);
    if (expected.IsDocument()) {
      if (const auto *eq = expected.ValueDocument().Get("$eq")) {
        return actual != nullptr && *actual == *eq;
      }
    }
    return actual != nullptr && *actual == expected;
  });
}

}  // namespace

void InMemoryBatchSource::Insert(const std::string &ns, std::vector<Document> documents) {
  auto guard = std::lock_guard{lock_};
  auto &collection = collections_[ns];
  collection.insert(collection.end(), std::make_move_iterator(documents.begin()),
                    std::make_move_iterator(documents.end()));
}

Batch InMemoryBatchSource::FetchInitial(const Query &query, const CursorOptions &options, SessionHandle &session) {
  initial_calls_.fetch_add(1);
  CheckSession(session);
  ValidateFilter(query.filter);

  auto guard = std::lock_guard{lock_};
  OpenCursor open_cursor{.session_id = session.Id()};
  if (auto it = collections_.find(query.ns); it != collections_.end()) {
    std::copy_if(it->second.begin(), it->second.end(), std::back_inserter(open_cursor.documents),
                 [&query](const auto &document) { return Matches(document, query.filter); });
  }

  const auto cursor_id = CursorId{next_cursor_id_++};
  const auto requested = options.batch_size.value_or(0);
  auto batch = TakeBatch(cursor_id, open_cursor, requested == 0 ? kDefaultBatchSize : requested);
  if (!batch.cursor_id.IsZero()) {
    open_cursors_.emplace(cursor_id, std::move(open_cursor));
  }
  spdlog::trace("[InMemoryBatchSource] find on {} returned {} documents, cursor id {}.", query.ns,
                batch.documents.size(), batch.cursor_id);
  return batch;
}

Batch InMemoryBatchSource::FetchMore(CursorId cursor_id, std::optional<uint32_t> batch_size, SessionHandle &session) {
  more_calls_.fetch_add(1);
  CheckSession(session);

  auto guard = std::lock_guard{lock_};
  auto it = open_cursors_.find(cursor_id);
  if (it == open_cursors_.end()) {
    throw ServerException(kCursorNotFoundCode, "cursor id {} not found", cursor_id);
  }
  if (it->second.session_id != session.Id()) {
    throw ServerException(kCursorNotFoundCode, "cursor id {} was not created by session {}", cursor_id,
                          session.Id());
  }

  const auto requested = batch_size.value_or(0);
  auto batch = TakeBatch(cursor_id, it->second, requested == 0 ? std::numeric_limits<uint32_t>::max() : requested);
  if (batch.cursor_id.IsZero()) {
    open_cursors_.erase(it);
  }
  spdlog::trace("[InMemoryBatchSource] getMore on cursor {} returned {} documents, cursor id {}.", cursor_id,
                batch.documents.size(), batch.cursor_id);
  return batch;
}

void InMemoryBatchSource::Kill(CursorId cursor_id, SessionHandle &session) {
  kill_calls_.fetch_add(1);
  CheckSession(session);

  auto guard = std::lock_guard{lock_};
  // Killing an unknown cursor is not an error, the server reports it as not found and moves on.
  if (open_cursors_.erase(cursor_id) == 0) {
    spdlog::debug("[InMemoryBatchSource] killCursors: cursor {} not found.", cursor_id);
    return;
  }
  killed_cursors_.push_back(cursor_id);
}

Batch InMemoryBatchSource::TakeBatch(CursorId cursor_id, OpenCursor &open_cursor, uint32_t limit) {
  Batch batch;
  const auto remaining = open_cursor.documents.size() - open_cursor.position;
  const auto count = std::min<size_t>(remaining, limit);
  batch.documents.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    batch.documents.push_back(open_cursor.documents[open_cursor.position++]);
  }
  batch.cursor_id = open_cursor.position == open_cursor.documents.size() ? CursorId::Zero() : cursor_id;
  return batch;
}

size_t InMemoryBatchSource::OpenCursors() const {
  auto guard = std::lock_guard{lock_};
  return open_cursors_.size();
}

bool InMemoryBatchSource::IsOpen(CursorId cursor_id) const {
  auto guard = std::lock_guard{lock_};
  return open_cursors_.contains(cursor_id);
}

std::vector<CursorId> InMemoryBatchSource::KilledCursors() const {
  auto guard = std::lock_guard{lock_};
  return killed_cursors_;
}

}  // namespace batchcursor::cursor
