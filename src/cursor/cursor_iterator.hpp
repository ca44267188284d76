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

#include <cstddef>
#include <iterator>
#include <optional>

#include "cursor/value.hpp"

namespace batchcursor::cursor {

class Cursor;

/**
 * Single pass input iterator over a cursor, so a cursor can be consumed with a
 * range based for loop. Every increment pulls the next document through the
 * cursor's transforms. When a pull fails the cursor is closed and the
 * exception propagates out of the loop.
 */
class CursorIterator {
 public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Value;
  using difference_type = std::ptrdiff_t;
  using pointer = const Value *;
  using reference = const Value &;

  /// The end iterator.
  CursorIterator() = default;

  explicit CursorIterator(Cursor *cursor);

  reference operator*() const { return *current_; }
  pointer operator->() const { return &*current_; }

  CursorIterator &operator++() {
    Pull();
    return *this;
  }

  void operator++(int) { Pull(); }

  friend bool operator==(const CursorIterator &a, const CursorIterator &b) { return a.cursor_ == b.cursor_; }

 private:
  void Pull();

  Cursor *cursor_{nullptr};
  std::optional<Value> current_;
};

}  // namespace batchcursor::cursor
