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


#include "flags/cursor.hpp"

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(cursor_batch_size, 0,
                        "Number of documents requested per batch. 0 lets the server pick its default.",
                        FLAG_IN_RANGE(0, batchcursor::flags::kMaxCursorBatchSize));

namespace batchcursor::flags {

cursor::CursorOptions CursorOptionsFromFlags() {
  cursor::CursorOptions options;
  if (FLAGS_cursor_batch_size != 0) options.batch_size = static_cast<uint32_t>(FLAGS_cursor_batch_size);
  return options;
}

}  // namespace batchcursor::flags
