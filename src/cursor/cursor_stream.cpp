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

#include "cursor/cursor_stream.hpp"

#include <future>

#include "cursor/cursor.hpp"
#include "cursor/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/on_scope_exit.hpp"

namespace batchcursor::cursor {

CursorStream::CursorStream(Cursor *cursor, StreamOptions options) : cursor_(cursor), options_(std::move(options)) {}

CursorStream &CursorStream::OnData(DataHandler handler) {
  data_handler_ = std::move(handler);
  return *this;
}

CursorStream &CursorStream::OnError(ErrorHandler handler) {
  error_handler_ = std::move(handler);
  return *this;
}

CursorStream &CursorStream::OnEnd(EventHandler handler) {
  end_handler_ = std::move(handler);
  return *this;
}

CursorStream &CursorStream::OnClose(EventHandler handler) {
  close_handler_ = std::move(handler);
  return *this;
}

std::optional<Value> CursorStream::PullNext() {
  while (auto value = cursor_->Next()) {
    if (!options_.transform) return value;
    if (auto transformed = options_.transform(std::move(*value))) return transformed;
  }
  return std::nullopt;
}

void CursorStream::Run() {
  if (running_.exchange(true, std::memory_order_acq_rel)) throw UsageException("Cursor stream is already running.");
  DriveWhileRunnable();
}

void CursorStream::DriveWhileRunnable() {
  while (true) {
    {
      utils::OnScopeExit release_driver{[this] { running_.store(false, std::memory_order_release); }};
      Drive();
    }
    // A Resume() which saw this run still in progress left the driving to it.
    if (IsPaused() || IsDestroyed() || Finished()) return;
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
  }
}

void CursorStream::Drive() {
  while (!IsPaused() && !IsDestroyed() && !Finished()) {
    try {
      auto value = PullNext();
      // Destroy() may have run while the pull was blocked on a fetch.
      if (IsDestroyed()) return;
      if (!value) {
        End();
        return;
      }
      if (data_handler_) data_handler_(*value);
    } catch (...) {
      // No-op when the stream was destroyed while the pull was in flight.
      Fail(std::current_exception());
      return;
    }
  }
}

utils::Future<void> CursorStream::RunAsync(utils::ThreadPool &pool) {
  std::packaged_task<void()> task([this] { Run(); });
  auto future = utils::MakeFuture(task.get_future());
  pool.AddTask([task = std::move(task)]() mutable { task(); });
  return future;
}

void CursorStream::Pause() { paused_.store(true, std::memory_order_release); }

void CursorStream::Resume() {
  paused_.store(false, std::memory_order_release);
  if (running_.exchange(true, std::memory_order_acq_rel)) return;
  DriveWhileRunnable();
}

void CursorStream::Destroy() {
  if (destroyed_.exchange(true, std::memory_order_acq_rel)) return;
  spdlog::trace("[CursorStream {}] destroyed.", cursor_->ns());
  finished_.store(true, std::memory_order_release);
  cursor_->CloseAfterError();
  EmitClose();
}

void CursorStream::Fail(std::exception_ptr error) {
  if (IsDestroyed() || finished_.exchange(true, std::memory_order_acq_rel)) return;
  cursor_->CloseAfterError();
  if (error_handler_) {
    try {
      error_handler_(error);
    } catch (const std::exception &e) {
      spdlog::error("[CursorStream {}] error handler threw: {}", cursor_->ns(), e.what());
    } catch (...) {
      spdlog::error("[CursorStream {}] error handler threw an unknown exception.", cursor_->ns());
    }
  } else {
    spdlog::debug("[CursorStream {}] failed without an error handler.", cursor_->ns());
  }
  EmitClose();
}

void CursorStream::End() {
  if (IsDestroyed() || finished_.exchange(true, std::memory_order_acq_rel)) return;
  ended_.store(true, std::memory_order_release);
  if (end_handler_) {
    try {
      end_handler_();
    } catch (const std::exception &e) {
      spdlog::error("[CursorStream {}] end handler threw: {}", cursor_->ns(), e.what());
    } catch (...) {
      spdlog::error("[CursorStream {}] end handler threw an unknown exception.", cursor_->ns());
    }
  }
  EmitClose();
}

void CursorStream::EmitClose() {
  if (close_emitted_.exchange(true, std::memory_order_acq_rel)) return;
  if (!close_handler_) return;
  try {
    close_handler_();
  } catch (const std::exception &e) {
    spdlog::error("[CursorStream {}] close handler threw: {}", cursor_->ns(), e.what());
  } catch (...) {
    spdlog::error("[CursorStream {}] close handler threw an unknown exception.", cursor_->ns());
  }
}

}  // namespace batchcursor::cursor
