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
#include <string>

#include "cursor/value.hpp"

namespace batchcursor::cursor {

/// The query a cursor was opened with. The cursor carries it opaquely and only
/// hands it to its `BatchSource`.
struct Query {
  std::string ns;  //<! `database.collection` the query targets
  Document filter;
};

struct CursorOptions {
  /// Upper bound of documents per fetch. Unset lets the source pick its default.
  std::optional<uint32_t> batch_size;
};

}  // namespace batchcursor::cursor
