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
#include <optional>
#include <vector>

#include "cursor/config.hpp"
#include "cursor/cursor_id.hpp"
#include "cursor/session.hpp"
#include "cursor/value.hpp"

namespace batchcursor::cursor {

/// One round trip's worth of documents together with the cursor id the server
/// returned. A zero id means the server holds no more results.
struct Batch {
  CursorId cursor_id;
  std::vector<Document> documents;
};

/**
 * Performs the network side of a cursor: the initial query, subsequent page
 * fetches and the kill request.
 *
 * Every call may block on a round trip. Implementations report failures by
 * throwing, preferably a subclass of `UpstreamException`, and the cursor
 * rethrows whatever was thrown unchanged. Timeouts and cancellation are the
 * implementation's concern.
 */
class BatchSource {
 public:
  BatchSource() = default;
  BatchSource(const BatchSource &) = delete;
  BatchSource &operator=(const BatchSource &) = delete;
  BatchSource(BatchSource &&) = delete;
  BatchSource &operator=(BatchSource &&) = delete;
  virtual ~BatchSource() = default;

  virtual Batch FetchInitial(const Query &query, const CursorOptions &options, SessionHandle &session) = 0;

  virtual Batch FetchMore(CursorId cursor_id, std::optional<uint32_t> batch_size, SessionHandle &session) = 0;

  virtual void Kill(CursorId cursor_id, SessionHandle &session) = 0;
};

}  // namespace batchcursor::cursor
