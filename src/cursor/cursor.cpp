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

#include "cursor/cursor.hpp"

#include <algorithm>
#include <array>
#include <ostream>
#include <string_view>
#include <utility>

#include "cursor/cursor_stream.hpp"
#include "utils/enum.hpp"
#include "utils/logging.hpp"

namespace batchcursor::cursor {

using namespace std::string_view_literals;

namespace {

constexpr std::array kCursorStateMappings{std::pair{"OPEN"sv, CursorState::Open},
                                          std::pair{"ITERATING"sv, CursorState::Iterating},
                                          std::pair{"EXHAUSTED"sv, CursorState::Exhausted},
                                          std::pair{"KILLED"sv, CursorState::Killed}};

constexpr std::array kTerminationCauseMappings{std::pair{"exhausted"sv, TerminationCause::Exhausted},
                                               std::pair{"closed"sv, TerminationCause::Closed},
                                               std::pair{"transform error"sv, TerminationCause::TransformError},
                                               std::pair{"upstream error"sv, TerminationCause::UpstreamError}};

std::string_view DescribeException(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, CursorState state) {
  return os << utils::EnumToString<CursorState>(state, kCursorStateMappings).value_or("UNKNOWN");
}

std::ostream &operator<<(std::ostream &os, TerminationCause cause) {
  return os << utils::EnumToString<TerminationCause>(cause, kTerminationCauseMappings).value_or("unknown");
}

Cursor::PullGuard::PullGuard(Cursor *cursor) : cursor_(cursor) {
  if (cursor_->busy_.exchange(true, std::memory_order_acq_rel)) throw ConcurrentPullException();
}

Cursor::PullGuard::~PullGuard() { cursor_->busy_.store(false, std::memory_order_release); }

Cursor::Cursor(BatchSource *source, SessionManager *sessions, Query query, CursorOptions options)
    : source_(source),
      sessions_(sessions),
      query_(std::move(query)),
      options_(std::move(options)),
      session_(sessions_->StartSession()) {
  BC_ASSERT(source_ != nullptr, "Cursor on {} has no batch source", query_.ns);
  BC_ASSERT(session_ != nullptr, "Session manager returned no session for cursor on {}", query_.ns);
}

Cursor::~Cursor() { CloseAfterError(); }

Cursor &Cursor::BatchSize(uint32_t batch_size) {
  auto guard = std::lock_guard{lock_};
  if (state_ != CursorState::Open) throw CursorInUseException("BatchSize");
  options_.batch_size = batch_size;
  return *this;
}

Cursor &Cursor::OnClose(CloseListener listener) {
  auto guard = std::lock_guard{lock_};
  close_listeners_.push_back(std::move(listener));
  return *this;
}

void Cursor::AssertUninitialized(std::string_view operation) const {
  auto guard = std::lock_guard{lock_};
  if (state_ != CursorState::Open) throw CursorInUseException(operation);
}

bool Cursor::HasNext() {
  PullGuard pull_guard(this);
  PendingNotification pending;
  bool has_next = false;
  {
    auto guard = std::lock_guard{lock_};
    if (IsTerminal(state_)) return false;
    RefillLocked(FetchMode::UntilDocuments, pending);
    has_next = !buffer_.empty();
    if (!has_next && !pending.error) TerminateLocked(TerminationCause::Exhausted, pending);
  }
  Deliver(std::move(pending));
  return has_next;
}

std::optional<Value> Cursor::Next() {
  PullGuard guard(this);
  return Advance(FetchMode::UntilDocuments);
}

std::optional<Value> Cursor::TryNext() {
  PullGuard guard(this);
  return Advance(FetchMode::Once);
}

std::vector<Value> Cursor::ToArray() {
  PullGuard guard(this);
  std::vector<Value> values;
  try {
    while (auto value = Advance(FetchMode::UntilDocuments)) {
      values.push_back(std::move(*value));
    }
  } catch (...) {
    CloseAfterError();
    throw;
  }
  return values;
}

std::optional<Value> Cursor::Advance(FetchMode mode) {
  PendingNotification pending;
  std::optional<Document> raw;
  {
    auto guard = std::lock_guard{lock_};
    if (state_ == CursorState::Killed) throw CursorExhaustedException();
    if (state_ == CursorState::Exhausted) return std::nullopt;

    RefillLocked(mode, pending);
    if (!buffer_.empty()) {
      raw.emplace(std::move(buffer_.front()));
      buffer_.pop_front();
    } else if (id_.IsZero() && !pending.error) {
      // Closing is lazy: the server may have reported its last batch long
      // ago, we only exhaust once somebody asks for a document past the end.
      TerminateLocked(TerminationCause::Exhausted, pending);
    }
  }
  Deliver(std::move(pending));
  if (!raw) return std::nullopt;

  if (transforms_.empty()) return Value(std::move(*raw));
  try {
    return transforms_.Apply(std::move(*raw));
  } catch (...) {
    Terminate(TerminationCause::TransformError);
    throw;
  }
}

void Cursor::RefillLocked(FetchMode mode, PendingNotification &pending) {
  if (!buffer_.empty()) return;
  try {
    auto absorb = [this](Batch batch) {
      id_ = batch.cursor_id;
      spdlog::trace("[Cursor {}] received a batch of {} documents, cursor id {}.", query_.ns, batch.documents.size(),
                    id_);
      for (auto &document : batch.documents) {
        buffer_.push_back(std::move(document));
      }
    };

    if (state_ == CursorState::Open) {
      state_ = CursorState::Iterating;
      absorb(source_->FetchInitial(query_, options_, *session_));
      if (mode == FetchMode::Once) return;
    }
    while (buffer_.empty() && !id_.IsZero()) {
      absorb(source_->FetchMore(id_, options_.batch_size, *session_));
      if (mode == FetchMode::Once) return;
    }
  } catch (...) {
    pending.error = std::current_exception();
    spdlog::debug("[Cursor {}] fetching failed: {}", query_.ns, DescribeException(pending.error));
    TerminateLocked(TerminationCause::UpstreamError, pending);
  }
}

void Cursor::TerminateLocked(TerminationCause cause, PendingNotification &pending) {
  if (IsTerminal(state_)) return;

  const auto live_id = std::exchange(id_, CursorId::Zero());
  state_ = cause == TerminationCause::Exhausted ? CursorState::Exhausted : CursorState::Killed;
  termination_cause_ = cause;
  buffer_.clear();

  if (!live_id.IsZero()) {
    try {
      source_->Kill(live_id, *session_);
    } catch (...) {
      auto kill_error = std::current_exception();
      spdlog::warn("[Cursor {}] killing server cursor {} failed: {}", query_.ns, live_id,
                   DescribeException(kill_error));
      // The caller of an explicit close gets the kill failure, on the other
      // paths the failure that terminated the cursor takes precedence.
      if (cause == TerminationCause::Closed) pending.error = kill_error;
    }
  }
  session_->End();
  spdlog::debug("[Cursor {}] terminated ({}), server cursor {}.", query_.ns, cause, live_id);

  pending.cause = cause;
  pending.listeners = close_listeners_;
}

void Cursor::Deliver(PendingNotification pending) {
  if (pending.cause) {
    for (const auto &listener : pending.listeners) {
      try {
        listener(*pending.cause);
      } catch (const std::exception &e) {
        spdlog::error("Cursor close listener threw: {}", e.what());
      } catch (...) {
        spdlog::error("Cursor close listener threw an unknown exception.");
      }
    }
  }
  if (pending.error) std::rethrow_exception(pending.error);
}

void Cursor::Terminate(TerminationCause cause) {
  PendingNotification pending;
  {
    auto guard = std::lock_guard{lock_};
    TerminateLocked(cause, pending);
  }
  Deliver(std::move(pending));
}

void Cursor::Close() { Terminate(TerminationCause::Closed); }

void Cursor::CloseAfterError() noexcept {
  try {
    Close();
  } catch (const std::exception &e) {
    spdlog::warn("[Cursor {}] close failed: {}", query_.ns, e.what());
  } catch (...) {
    spdlog::warn("[Cursor {}] close failed with an unknown exception.", query_.ns);
  }
}

void Cursor::Rewind() {
  PullGuard pull_guard(this);
  auto guard = std::lock_guard{lock_};
  if (state_ == CursorState::Open) return;

  if (const auto live_id = std::exchange(id_, CursorId::Zero()); !live_id.IsZero()) {
    try {
      source_->Kill(live_id, *session_);
    } catch (const std::exception &e) {
      spdlog::warn("[Cursor {}] killing server cursor {} on rewind failed: {}", query_.ns, live_id, e.what());
    }
  }
  session_->End();
  session_ = sessions_->StartSession();
  BC_ASSERT(session_ != nullptr, "Session manager returned no session for cursor on {}", query_.ns);

  buffer_.clear();
  state_ = CursorState::Open;
  termination_cause_.reset();
  spdlog::debug("[Cursor {}] rewound with session {}.", query_.ns, session_->Id());
}

std::unique_ptr<Cursor> Cursor::Clone() const {
  auto guard = std::lock_guard{lock_};
  return std::make_unique<Cursor>(source_, sessions_, query_, options_);
}

size_t Cursor::BufferedCount() const {
  auto guard = std::lock_guard{lock_};
  return buffer_.size();
}

std::vector<Document> Cursor::ReadBufferedDocuments(std::optional<size_t> number) {
  auto guard = std::lock_guard{lock_};
  const auto count = std::min(number.value_or(buffer_.size()), buffer_.size());
  std::vector<Document> documents;
  documents.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    documents.push_back(std::move(buffer_.front()));
    buffer_.pop_front();
  }
  return documents;
}

std::unique_ptr<CursorStream> Cursor::Stream(StreamOptions options) {
  return std::make_unique<CursorStream>(this, std::move(options));
}

std::unique_ptr<CursorStream> Cursor::Stream() { return Stream(StreamOptions{}); }

CursorId Cursor::id() const {
  auto guard = std::lock_guard{lock_};
  return id_;
}

CursorState Cursor::state() const {
  auto guard = std::lock_guard{lock_};
  return state_;
}

bool Cursor::closed() const { return state() == CursorState::Exhausted; }

bool Cursor::killed() const { return state() == CursorState::Killed; }

std::optional<TerminationCause> Cursor::termination_cause() const {
  auto guard = std::lock_guard{lock_};
  return termination_cause_;
}

std::shared_ptr<const SessionHandle> Cursor::session() const {
  auto guard = std::lock_guard{lock_};
  return session_;
}

CursorIterator::CursorIterator(Cursor *cursor) : cursor_(cursor) { Pull(); }

void CursorIterator::Pull() {
  try {
    current_ = cursor_->Next();
  } catch (...) {
    cursor_->CloseAfterError();
    cursor_ = nullptr;
    current_.reset();
    throw;
  }
  if (!current_) cursor_ = nullptr;
}

}  // namespace batchcursor::cursor
