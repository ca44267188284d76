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

#include "gflags/gflags.h"

#include "cursor/config.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_uint64(cursor_batch_size);

namespace batchcursor::flags {

inline constexpr uint64_t kMaxCursorBatchSize = 1'000'000;

/// Builds cursor options from `--cursor_batch_size`. Zero leaves the batch
/// size to the server.
cursor::CursorOptions CursorOptionsFromFlags();

}  // namespace batchcursor::flags
