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


#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include <utils/future.hpp>
#include <utils/thread_pool.hpp>

using namespace std::chrono_literals;

namespace {

void WaitForTasks(const batchcursor::utils::ThreadPool &pool) {
  while (pool.UnfinishedTasksNum() != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

}  // namespace

TEST(ThreadPool, Basic) {
  static constexpr size_t adder_count = 100000;
  static constexpr std::array<size_t, 4> pool_sizes{1, 2, 4, 16};

  for (const auto pool_size : pool_sizes) {
    batchcursor::utils::ThreadPool pool{pool_size};

    std::atomic<size_t> count{0};
    for (size_t i = 0; i < adder_count; ++i) {
      pool.AddTask([&] { count.fetch_add(1); });
    }
    WaitForTasks(pool);
    ASSERT_EQ(count.load(), adder_count);
  }
}

// Tasks holding a packaged_task or a unique_ptr can't be copied.
TEST(ThreadPool, MoveOnlyTasks) {
  static constexpr size_t task_count = 1000;
  batchcursor::utils::ThreadPool pool{4};

  std::atomic<int> count{0};
  for (size_t i = 0; i < task_count; ++i) {
    auto ptr = std::make_unique<int>(1);
    pool.AddTask([p = std::move(ptr), &count]() { count.fetch_add(*p); });
  }
  WaitForTasks(pool);
  ASSERT_EQ(count.load(), task_count);
}

TEST(ThreadPool, ShutDownDropsQueuedTasks) {
  batchcursor::utils::ThreadPool pool{1};
  std::promise<void> started;
  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic<int> finished{0};

  pool.AddTask([released, &started, &finished] {
    started.set_value();
    released.wait();
    finished.fetch_add(1);
  });
  started.get_future().wait();
  for (int i = 0; i < 10; ++i) {
    pool.AddTask([&finished] { finished.fetch_add(1); });
  }

  std::jthread releaser([&release] {
    std::this_thread::sleep_for(50ms);
    release.set_value();
  });
  pool.ShutDown();

  EXPECT_EQ(finished.load(), 1);
  EXPECT_EQ(pool.UnfinishedTasksNum(), 0);

  pool.AddTask([&finished] { finished.fetch_add(1); });
  pool.ShutDown();
  EXPECT_EQ(finished.load(), 1);
}

TEST(Future, CarriesResultFromPool) {
  batchcursor::utils::ThreadPool pool{2};
  std::packaged_task<int()> task([] { return 42; });
  auto future = batchcursor::utils::MakeFuture(task.get_future());
  pool.AddTask([task = std::move(task)]() mutable { task(); });

  ASSERT_TRUE(future.IsValid());
  EXPECT_TRUE(future.WaitFor(5s));
  EXPECT_TRUE(future.IsReady());
  EXPECT_EQ(future.Get(), 42);
  EXPECT_FALSE(future.IsValid());
}

TEST(Future, RethrowsTaskException) {
  batchcursor::utils::ThreadPool pool{1};
  std::packaged_task<void()> task([] { throw std::runtime_error("task failed"); });
  auto future = batchcursor::utils::MakeFuture(task.get_future());
  pool.AddTask([task = std::move(task)]() mutable { task(); });
  EXPECT_THROW(future.Get(), std::runtime_error);
}

TEST(Future, DestructorWaits) {
  std::atomic<bool> done{false};
  batchcursor::utils::ThreadPool pool{1};
  {
    std::packaged_task<void()> task([&done] {
      std::this_thread::sleep_for(50ms);
      done.store(true);
    });
    auto future = batchcursor::utils::MakeFuture(task.get_future());
    pool.AddTask([task = std::move(task)]() mutable { task(); });
  }
  EXPECT_TRUE(done.load());
}

TEST(ThreadPool, ThrowingTaskDoesNotStopTheWorker) {
  batchcursor::utils::ThreadPool pool{1};
  std::atomic<int> count{0};
  pool.AddTask([] { throw std::runtime_error("task failed"); });
  pool.AddTask([&count] { count.fetch_add(1); });
  WaitForTasks(pool);
  EXPECT_EQ(count.load(), 1);
}

TEST(ThreadPool, TaskThrowingANonStandardExceptionDoesNotStopTheWorker) {
  batchcursor::utils::ThreadPool pool{1};
  std::atomic<int> count{0};
  pool.AddTask([] { throw 42; });
  pool.AddTask([&count] { count.fetch_add(1); });
  WaitForTasks(pool);
  EXPECT_EQ(count.load(), 1);
}
