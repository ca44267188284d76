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
#include <concepts>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/ostream.h>

#include "cursor/batch_source.hpp"
#include "cursor/config.hpp"
#include "cursor/cursor_id.hpp"
#include "cursor/cursor_iterator.hpp"
#include "cursor/exceptions.hpp"
#include "cursor/session.hpp"
#include "cursor/transform_chain.hpp"
#include "cursor/value.hpp"

namespace batchcursor::cursor {

class CursorStream;
struct StreamOptions;

enum class CursorState : uint8_t { Open, Iterating, Exhausted, Killed };

/// Why a cursor left the iterating state. Every cause except `Exhausted`
/// leaves the cursor killed.
enum class TerminationCause : uint8_t { Exhausted, Closed, TransformError, UpstreamError };

std::ostream &operator<<(std::ostream &os, CursorState state);
std::ostream &operator<<(std::ostream &os, TerminationCause cause);

/**
 * Lazy iterator over a server paginated query result.
 *
 * The cursor buffers one batch at a time and asks its `BatchSource` for the
 * next one only when the buffer is empty and the server still holds results
 * (non-zero id). Documents are run through the registered transforms when they
 * are produced, never while they sit in the buffer.
 *
 * A cursor supports a single consumer: overlapping pulls from several threads
 * are rejected with `ConcurrentPullException`. `Close()` may be called from any
 * thread at any time, it waits for an in-flight fetch to finish so the kill
 * request always targets the current cursor id.
 *
 * The session is ended exactly once, when the cursor is exhausted or killed,
 * whichever happens first. Callers may share it through `session()`, only the
 * cursor ends it.
 */
class Cursor {
 public:
  using CloseListener = std::function<void(TerminationCause)>;

  /// `source` and `sessions` must outlive the cursor.
  Cursor(BatchSource *source, SessionManager *sessions, Query query, CursorOptions options = {});

  /// Closes the cursor when it is still live. Kill failures are logged.
  ~Cursor();

  Cursor(const Cursor &) = delete;
  Cursor &operator=(const Cursor &) = delete;
  Cursor(Cursor &&) = delete;
  Cursor &operator=(Cursor &&) = delete;

  /**
   * Appends a transform and returns the cursor for chaining. `func` gets the
   * previous transform's output (the raw document wrapped in a `Value` for the
   * first one). It may return a `Value` or a `std::optional<Value>`, returning
   * an empty optional kills the cursor with `InvalidTransformResultException`.
   *
   * @throws CursorInUseException when the cursor already fetched its first batch
   */
  template <typename TFunc>
  requires std::invocable<TFunc &, Value>
  Cursor &Map(TFunc &&func) {
    AssertUninitialized("Map");
    transforms_.Append(MakeTransform(std::forward<TFunc>(func)));
    return *this;
  }

  /// @throws CursorInUseException when the cursor already fetched its first batch
  Cursor &BatchSize(uint32_t batch_size);

  /// Registers a listener invoked once the cursor terminates, after the session
  /// has ended. Listeners run on the thread which terminated the cursor.
  Cursor &OnClose(CloseListener listener);

  /// Returns whether a document is available, fetching as many batches as
  /// needed. Never removes a document and never runs transforms. Returns false
  /// on a terminated cursor and exhausts a live cursor which has nothing left.
  bool HasNext();

  /// Returns the next transformed document, an empty optional once the result
  /// is exhausted.
  ///
  /// @throws CursorExhaustedException when the cursor was killed
  std::optional<Value> Next();

  /// Same as `Next` but fetches at most one batch. An empty optional with
  /// `closed() == false` means the fetched batch was empty but the server still
  /// holds results.
  std::optional<Value> TryNext();

  /**
   * Calls `visitor` with every remaining document. When the visitor returns
   * `bool`, returning false stops the iteration and leaves the cursor open.
   * Any exception closes the cursor and propagates.
   */
  template <typename TVisitor>
  requires std::invocable<TVisitor &, Value &>
  void ForEach(TVisitor &&visitor) {
    PullGuard guard(this);
    try {
      while (auto value = Advance(FetchMode::UntilDocuments)) {
        if constexpr (std::is_same_v<std::invoke_result_t<TVisitor &, Value &>, bool>) {
          if (!visitor(*value)) return;
        } else {
          visitor(*value);
        }
      }
    } catch (...) {
      CloseAfterError();
      throw;
    }
  }

  /// Returns all remaining documents. Any exception closes the cursor and propagates.
  std::vector<Value> ToArray();

  CursorIterator begin() { return CursorIterator(this); }
  CursorIterator end() { return {}; }

  /// Returns a push based stream over the remaining documents.
  std::unique_ptr<CursorStream> Stream(StreamOptions options);
  std::unique_ptr<CursorStream> Stream();

  /**
   * Kills the cursor unless it already terminated: the server cursor is killed
   * when its id is live, buffered documents are discarded and the session
   * ends. Calling it again has no effect.
   *
   * When the kill request fails the cursor is still killed and the session
   * ended, then the kill failure is rethrown.
   */
  void Close();

  /// Resets the cursor to its unopened state with a new session. The live
  /// server cursor, if any, is killed first and the old session is ended.
  /// Transforms and options are kept.
  void Rewind();

  /// Returns a new unopened cursor over the same query and options. Transforms
  /// are not copied.
  std::unique_ptr<Cursor> Clone() const;

  /// Number of raw documents held in the buffer.
  size_t BufferedCount() const;

  /// Removes up to `number` (all by default) buffered raw documents without
  /// fetching and without running transforms.
  std::vector<Document> ReadBufferedDocuments(std::optional<size_t> number = std::nullopt);

  CursorId id() const;
  CursorState state() const;
  /// True only once the result was consumed to its end.
  bool closed() const;
  /// True only once the cursor was closed or failed before its end.
  bool killed() const;
  std::optional<TerminationCause> termination_cause() const;
  /// The current session. Stays valid after `Rewind()` replaces it, the old
  /// session is ended but not freed while a caller holds it.
  std::shared_ptr<const SessionHandle> session() const;
  const std::string &ns() const { return query_.ns; }
  const CursorOptions &options() const { return options_; }

 private:
  friend class CursorIterator;
  friend class CursorStream;

  enum class FetchMode : uint8_t { UntilDocuments, Once };

  /// Rejects overlapping pulls on the same cursor.
  class PullGuard {
   public:
    explicit PullGuard(Cursor *cursor);
    ~PullGuard();
    PullGuard(const PullGuard &) = delete;
    PullGuard &operator=(const PullGuard &) = delete;
    PullGuard(PullGuard &&) = delete;
    PullGuard &operator=(PullGuard &&) = delete;

   private:
    Cursor *cursor_;
  };

  /// Work left over from a terminating transition which must happen after
  /// `lock_` is released.
  struct PendingNotification {
    std::optional<TerminationCause> cause;
    std::vector<CloseListener> listeners;
    std::exception_ptr error;
  };

  /// The single pull primitive every consumption style is built on. Returns
  /// an empty optional when the result is exhausted, or in `Once` mode when the
  /// one allowed fetch brought no documents.
  std::optional<Value> Advance(FetchMode mode);

  /// Must hold `lock_`. Fetches until the buffer holds a document or the server
  /// has nothing more (`Once` stops after a single fetch). Upstream failures
  /// terminate the cursor and end up in `pending.error`.
  void RefillLocked(FetchMode mode, PendingNotification &pending);

  /// Must hold `lock_`. The only way into a terminal state.
  void TerminateLocked(TerminationCause cause, PendingNotification &pending);

  /// Runs the listeners, then rethrows `pending.error` when set.
  static void Deliver(PendingNotification pending);

  void Terminate(TerminationCause cause);

  /// Close for error paths, a failing kill is logged instead of thrown.
  void CloseAfterError() noexcept;

  void AssertUninitialized(std::string_view operation) const;

  static bool IsTerminal(CursorState state) { return state == CursorState::Exhausted || state == CursorState::Killed; }

  BatchSource *source_;
  SessionManager *sessions_;
  const Query query_;
  CursorOptions options_;
  TransformChain transforms_;

  mutable std::mutex lock_;
  std::deque<Document> buffer_;
  CursorId id_;
  CursorState state_{CursorState::Open};
  std::optional<TerminationCause> termination_cause_;
  std::shared_ptr<SessionHandle> session_;
  std::vector<CloseListener> close_listeners_;

  std::atomic<bool> busy_{false};
};

}  // namespace batchcursor::cursor

template <>
class fmt::formatter<batchcursor::cursor::CursorState> : public fmt::ostream_formatter {};
template <>
class fmt::formatter<batchcursor::cursor::TerminationCause> : public fmt::ostream_formatter {};
