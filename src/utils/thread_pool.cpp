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


#include "utils/thread_pool.hpp"

#include <exception>

#include "utils/logging.hpp"

namespace batchcursor::utils {

ThreadPool::ThreadPool(const size_t pool_size) {
  workers_.reserve(pool_size);
  for (size_t i = 0; i < pool_size; ++i) {
    workers_.emplace_back([this] { WorkerLoop(); });
  }
  spdlog::trace("Thread pool started with {} workers.", pool_size);
}

void ThreadPool::AddTask(Task task) {
  {
    auto guard = std::lock_guard{lock_};
    if (stop_source_.stop_requested()) {
      spdlog::debug("Thread pool is shut down, dropping a task.");
      return;
    }
    tasks_.push(std::move(task));
    unfinished_tasks_.fetch_add(1);
  }
  tasks_cv_.notify_one();
}

void ThreadPool::ShutDown() {
  {
    auto guard = std::lock_guard{lock_};
    if (stop_source_.stop_requested()) return;
    stop_source_.request_stop();
    spdlog::trace("Thread pool shutting down, dropping {} queued tasks.", tasks_.size());
    unfinished_tasks_.fetch_sub(tasks_.size());
    tasks_ = {};
  }
  tasks_cv_.notify_all();
  workers_.clear();
}

ThreadPool::~ThreadPool() { ShutDown(); }

void ThreadPool::WorkerLoop() {
  const auto token = stop_source_.get_token();
  while (true) {
    Task task;
    {
      auto guard = std::unique_lock{lock_};
      tasks_cv_.wait(guard, token, [this] { return !tasks_.empty(); });
      if (token.stop_requested()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      task();
    } catch (const std::exception &e) {
      spdlog::error("Thread pool task failed: {}", e.what());
    } catch (...) {
      spdlog::error("Thread pool task failed with an unknown exception.");
    }
    unfinished_tasks_.fetch_sub(1);
  }
}

size_t ThreadPool::UnfinishedTasksNum() const { return unfinished_tasks_.load(); }

}  // namespace batchcursor::utils
