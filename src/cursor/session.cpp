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

#include "cursor/session.hpp"

#include "utils/logging.hpp"

namespace batchcursor::cursor {

ImplicitSession::ImplicitSession(uint64_t id, std::function<void(uint64_t)> on_end)
    : id_(id), on_end_(std::move(on_end)) {}

ImplicitSession::~ImplicitSession() {
  if (!HasEnded()) {
    spdlog::debug("[Session {}] destroyed without being ended, ending it now.", id_);
    End();
  }
}

void ImplicitSession::End() {
  if (ended_.exchange(true, std::memory_order_acq_rel)) return;
  spdlog::trace("[Session {}] ended.", id_);
  if (on_end_) on_end_(id_);
}

std::unique_ptr<SessionHandle> ImplicitSessionManager::StartSession() {
  const auto id = next_id_.fetch_add(1);
  active_.fetch_add(1);
  spdlog::trace("[Session {}] started.", id);
  return std::make_unique<ImplicitSession>(id, [this](uint64_t /*id*/) { active_.fetch_sub(1); });
}

}  // namespace batchcursor::cursor
