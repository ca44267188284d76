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


#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cursor/cursor.hpp"
#include "cursor/cursor_stream.hpp"
#include "cursor/exceptions.hpp"
#include "cursor/session.hpp"

using namespace batchcursor::cursor;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class MockBatchSource : public BatchSource {
 public:
  MOCK_METHOD(Batch, FetchInitial, (const Query &, const CursorOptions &, SessionHandle &), (override));
  MOCK_METHOD(Batch, FetchMore, (CursorId, std::optional<uint32_t>, SessionHandle &), (override));
  MOCK_METHOD(void, Kill, (CursorId, SessionHandle &), (override));
};

class CursorConcurrencyTest : public ::testing::Test {
 protected:
  static Batch MakeBatch(int64_t cursor_id, int64_t documents) {
    Batch batch{.cursor_id = CursorId{cursor_id}, .documents = {}};
    for (int64_t i = 0; i < documents; ++i) batch.documents.push_back(Document{{"_id", i}});
    return batch;
  }

  Cursor MakeCursor() { return Cursor(&source_, &sessions_, Query{.ns = "db.coll"}); }

  StrictMock<MockBatchSource> source_;
  ImplicitSessionManager sessions_;
};

TEST_F(CursorConcurrencyTest, OverlappingPullsAreRejected) {
  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();

  EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Invoke([&](const Query &, const CursorOptions &, SessionHandle &) {
    entered.set_value();
    released.wait();
    return MakeBatch(42, 1);
  }));
  EXPECT_CALL(source_, Kill(CursorId{42}, _)).Times(1);

  auto cursor = MakeCursor();
  {
    std::jthread consumer([&cursor] { EXPECT_TRUE(cursor.Next()); });
    entered.get_future().wait();

    EXPECT_THROW(cursor.Next(), ConcurrentPullException);
    EXPECT_THROW(cursor.TryNext(), ConcurrentPullException);
    EXPECT_THROW(cursor.HasNext(), ConcurrentPullException);
    EXPECT_THROW(cursor.ToArray(), ConcurrentPullException);
    EXPECT_THROW(cursor.ForEach([](Value &) {}), ConcurrentPullException);
    release.set_value();
  }

  // The rejected pulls left the cursor alone.
  EXPECT_EQ(cursor.state(), CursorState::Iterating);
  EXPECT_EQ(cursor.id(), CursorId{42});
}

TEST_F(CursorConcurrencyTest, CloseWaitsForTheFetchInFlight) {
  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic<bool> fetch_finished{false};

  {
    InSequence sequence;
    EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(7, 0)));
    // Returns a different id so the test can tell which one gets killed.
    EXPECT_CALL(source_, FetchMore(CursorId{7}, _, _))
        .WillOnce(Invoke([&](CursorId, std::optional<uint32_t>, SessionHandle &) {
          entered.set_value();
          released.wait();
          fetch_finished.store(true);
          return MakeBatch(8, 1);
        }));
    EXPECT_CALL(source_, Kill(CursorId{8}, _)).WillOnce(Invoke([&](CursorId, SessionHandle &session) {
      EXPECT_TRUE(fetch_finished.load());
      EXPECT_FALSE(session.HasEnded());
    }));
  }

  auto cursor = MakeCursor();
  std::jthread consumer([&cursor] { EXPECT_TRUE(cursor.Next()); });
  entered.get_future().wait();

  std::jthread closer([&cursor] { cursor.Close(); });
  // Give the close a chance to queue up behind the fetch.
  std::this_thread::sleep_for(50ms);
  release.set_value();

  consumer.join();
  closer.join();
  EXPECT_TRUE(cursor.killed());
  EXPECT_TRUE(cursor.id().IsZero());
  EXPECT_TRUE(cursor.session()->HasEnded());
}

TEST_F(CursorConcurrencyTest, StreamDestroyedDuringFetchEmitsNoMoreData) {
  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();

  {
    InSequence sequence;
    EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(7, 1)));
    EXPECT_CALL(source_, FetchMore(CursorId{7}, _, _))
        .WillOnce(Invoke([&](CursorId, std::optional<uint32_t>, SessionHandle &) {
          entered.set_value();
          released.wait();
          return MakeBatch(7, 2);
        }));
    EXPECT_CALL(source_, Kill(CursorId{7}, _));
  }

  auto cursor = MakeCursor();
  auto stream = cursor.Stream();
  std::atomic<int> data_events{0};
  std::vector<std::string> events;
  stream->OnData([&data_events](const Value &) { data_events.fetch_add(1); })
      .OnError([&events](std::exception_ptr) { events.emplace_back("error"); })
      .OnEnd([&events] { events.emplace_back("end"); })
      .OnClose([&events] { events.emplace_back("close"); });

  std::jthread runner([&stream] { stream->Run(); });
  entered.get_future().wait();
  EXPECT_EQ(data_events.load(), 1);

  std::jthread destroyer([&stream] { stream->Destroy(); });
  while (!stream->IsDestroyed()) std::this_thread::sleep_for(1ms);
  // Give the close a chance to queue up behind the fetch.
  std::this_thread::sleep_for(50ms);
  release.set_value();

  runner.join();
  destroyer.join();
  EXPECT_EQ(data_events.load(), 1);
  EXPECT_EQ(events, std::vector<std::string>{"close"});
  EXPECT_FALSE(stream->IsEnded());
  EXPECT_TRUE(cursor.killed());
  EXPECT_EQ(sessions_.ActiveSessions(), 0);
}

TEST_F(CursorConcurrencyTest, FailingKillOnCloseIsRethrown) {
  EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(5, 2)));
  EXPECT_CALL(source_, Kill(CursorId{5}, _)).WillOnce(Throw(NetworkException("connection reset")));

  auto cursor = MakeCursor();
  ASSERT_TRUE(cursor.Next());
  EXPECT_THROW(cursor.Close(), NetworkException);
  EXPECT_TRUE(cursor.killed());
  EXPECT_TRUE(cursor.id().IsZero());
  EXPECT_TRUE(cursor.session()->HasEnded());
  EXPECT_EQ(sessions_.ActiveSessions(), 0);

  EXPECT_NO_THROW(cursor.Close());
}

TEST_F(CursorConcurrencyTest, FailingKillDoesNotMaskTransformError) {
  struct TransformFailure : std::runtime_error {
    TransformFailure() : std::runtime_error("transform failed") {}
  };
  EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(5, 2)));
  EXPECT_CALL(source_, Kill(CursorId{5}, _)).WillOnce(Throw(NetworkException("connection reset")));

  auto cursor = MakeCursor();
  cursor.Map([](Value) -> Value { throw TransformFailure(); });
  EXPECT_THROW(cursor.Next(), TransformFailure);
  EXPECT_EQ(cursor.termination_cause(), TerminationCause::TransformError);
  EXPECT_TRUE(cursor.session()->HasEnded());
}

TEST_F(CursorConcurrencyTest, FetchMoreFailureKillsTheLiveCursor) {
  {
    InSequence sequence;
    EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(3, 1)));
    EXPECT_CALL(source_, FetchMore(CursorId{3}, _, _)).WillOnce(Throw(NetworkException("timed out")));
    EXPECT_CALL(source_, Kill(CursorId{3}, _));
  }

  auto cursor = MakeCursor();
  EXPECT_THROW(cursor.ToArray(), NetworkException);
  EXPECT_TRUE(cursor.killed());
  EXPECT_EQ(cursor.termination_cause(), TerminationCause::UpstreamError);
  EXPECT_EQ(sessions_.ActiveSessions(), 0);
}

TEST_F(CursorConcurrencyTest, BatchSizeIsForwarded) {
  {
    InSequence sequence;
    EXPECT_CALL(source_, FetchInitial(_, _, _))
        .WillOnce(Invoke([](const Query &query, const CursorOptions &options, SessionHandle &) {
          EXPECT_EQ(query.ns, "db.coll");
          EXPECT_EQ(options.batch_size, 2U);
          return MakeBatch(9, 2);
        }));
    EXPECT_CALL(source_, FetchMore(CursorId{9}, std::optional<uint32_t>{2}, _)).WillOnce(Return(MakeBatch(0, 1)));
  }

  auto cursor = MakeCursor();
  cursor.BatchSize(2);
  EXPECT_EQ(cursor.ToArray().size(), 3);
}

TEST_F(CursorConcurrencyTest, DestructorLogsFailingKill) {
  EXPECT_CALL(source_, FetchInitial(_, _, _)).WillOnce(Return(MakeBatch(5, 2)));
  EXPECT_CALL(source_, Kill(CursorId{5}, _)).WillOnce(Throw(NetworkException("connection reset")));
  {
    auto cursor = MakeCursor();
    ASSERT_TRUE(cursor.Next());
  }
  EXPECT_EQ(sessions_.ActiveSessions(), 0);
}
