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
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace batchcursor::utils {

/// Fixed-size pool of worker threads executing queued tasks in FIFO order.
/// Tasks may be move-only, e.g. a `std::packaged_task` feeding a `utils::Future`.
/// An exception escaping a task is logged and the worker moves on.
class ThreadPool {
  using Task = std::move_only_function<void()>;

 public:
  explicit ThreadPool(size_t pool_size);

  /// Tasks added after `ShutDown` are dropped.
  void AddTask(Task task);

  /// Drops queued tasks and joins the workers. Tasks that are already running finish first.
  void ShutDown();

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Queued plus running tasks.
  size_t UnfinishedTasksNum() const;

 private:
  void WorkerLoop();

  std::mutex lock_;
  std::condition_variable_any tasks_cv_;
  std::queue<Task> tasks_;
  std::stop_source stop_source_;  //<! Shared by all workers, `std::jthread`'s own stop tokens are unused
  std::vector<std::jthread> workers_;
  std::atomic<size_t> unfinished_tasks_{0};
};

}  // namespace batchcursor::utils
