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
#include <exception>
#include <functional>
#include <optional>

#include "cursor/value.hpp"
#include "utils/future.hpp"
#include "utils/thread_pool.hpp"

namespace batchcursor::cursor {

class Cursor;

struct StreamOptions {
  /// Applied after the cursor's own transforms. Returning an empty optional
  /// drops the document from the stream.
  std::function<std::optional<Value>(Value)> transform;
};

/**
 * Push based view of a cursor. `Run` pulls documents from the cursor and
 * delivers them to the data handler until the result is exhausted, the stream
 * is paused or destroyed, or something fails.
 *
 * Events are delivered in this order: any number of data events, then either
 * an end event (the result was consumed) or a single error event, and finally
 * one close event. Every failure, including exceptions thrown by the data
 * handler or the stream transform, closes the cursor and becomes an error
 * event, `Run` itself does not throw them.
 *
 * The stream does not own the cursor, the cursor must outlive it.
 */
class CursorStream {
 public:
  using DataHandler = std::function<void(const Value &)>;
  using ErrorHandler = std::function<void(std::exception_ptr)>;
  using EventHandler = std::function<void()>;

  CursorStream(Cursor *cursor, StreamOptions options);

  CursorStream(const CursorStream &) = delete;
  CursorStream &operator=(const CursorStream &) = delete;
  CursorStream(CursorStream &&) = delete;
  CursorStream &operator=(CursorStream &&) = delete;
  ~CursorStream() = default;

  CursorStream &OnData(DataHandler handler);
  CursorStream &OnError(ErrorHandler handler);
  CursorStream &OnEnd(EventHandler handler);
  CursorStream &OnClose(EventHandler handler);

  /// Drives the stream on the calling thread. Returns when the stream finished,
  /// was paused or was destroyed.
  ///
  /// @throws UsageException when the stream is already running
  void Run();

  /// Drives the stream on a pool thread. The returned future becomes ready once
  /// that run returns.
  utils::Future<void> RunAsync(utils::ThreadPool &pool);

  /// Stops delivery after the current document. Safe to call from a handler.
  void Pause();

  /// Clears a pause and, unless a run is still in progress, drives the stream
  /// on the calling thread. A run in progress picks the resumed stream up.
  void Resume();

  /// Closes the cursor. No data, end or error event follows, the close event
  /// is emitted unless it already was.
  void Destroy();

  bool IsPaused() const { return paused_.load(std::memory_order_acquire); }
  bool IsEnded() const { return ended_.load(std::memory_order_acquire); }
  bool IsDestroyed() const { return destroyed_.load(std::memory_order_acquire); }

 private:
  bool Finished() const { return finished_.load(std::memory_order_acquire); }

  /// Drives the stream while this thread holds `running_`. Takes the driving
  /// over again when a Resume() raced with the end of a paused run.
  void DriveWhileRunnable();
  void Drive();

  /// Pulls until a document survives the stream transform. Empty once the
  /// cursor is exhausted.
  std::optional<Value> PullNext();

  void Fail(std::exception_ptr error);
  void End();
  void EmitClose();

  Cursor *cursor_;
  StreamOptions options_;

  DataHandler data_handler_;
  ErrorHandler error_handler_;
  EventHandler end_handler_;
  EventHandler close_handler_;

  std::atomic<bool> running_{false};
  std::atomic<bool> paused_{false};
  std::atomic<bool> finished_{false};
  std::atomic<bool> ended_{false};
  std::atomic<bool> destroyed_{false};
  std::atomic<bool> close_emitted_{false};
};

}  // namespace batchcursor::cursor
