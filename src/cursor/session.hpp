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
#include <cstdint>
#include <functional>
#include <memory>

namespace batchcursor::cursor {

/// Server-side session scoping the operations of a cursor.
class SessionHandle {
 public:
  SessionHandle() = default;
  SessionHandle(const SessionHandle &) = delete;
  SessionHandle &operator=(const SessionHandle &) = delete;
  SessionHandle(SessionHandle &&) = delete;
  SessionHandle &operator=(SessionHandle &&) = delete;
  virtual ~SessionHandle() = default;

  /// Releases the server-side resource. Calling it more than once has no effect.
  virtual void End() = 0;
  virtual bool HasEnded() const = 0;
  virtual uint64_t Id() const = 0;
};

/// Hands out sessions. The cursor that starts a session is the only one ending
/// it, when the cursor terminates.
class SessionManager {
 public:
  SessionManager() = default;
  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;
  SessionManager(SessionManager &&) = delete;
  SessionManager &operator=(SessionManager &&) = delete;
  virtual ~SessionManager() = default;

  virtual std::unique_ptr<SessionHandle> StartSession() = 0;
};

/// Session which only exists on the client until the first command uses it.
/// `on_end` runs once, on the first `End()`.
class ImplicitSession final : public SessionHandle {
 public:
  explicit ImplicitSession(uint64_t id, std::function<void(uint64_t)> on_end = {});
  ~ImplicitSession() override;

  void End() override;
  bool HasEnded() const override { return ended_.load(std::memory_order_acquire); }
  uint64_t Id() const override { return id_; }

 private:
  uint64_t id_;
  std::function<void(uint64_t)> on_end_;
  std::atomic<bool> ended_{false};
};

/// Starts `ImplicitSession`s with increasing ids and keeps count of how many
/// of them are still active.
class ImplicitSessionManager final : public SessionManager {
 public:
  std::unique_ptr<SessionHandle> StartSession() override;

  uint64_t StartedSessions() const { return next_id_.load() - 1; }
  uint64_t ActiveSessions() const { return active_.load(); }

 private:
  std::atomic<uint64_t> next_id_{1};
  std::atomic<uint64_t> active_{0};
};

}  // namespace batchcursor::cursor
