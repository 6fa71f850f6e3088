// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "queue/queue.h"

namespace ocw::queue {

class QueueTest : public ::testing::Test {};

TEST_F(QueueTest, ManyProducersManyConsumers) {
  std::atomic<int> sum(0);
  std::vector<std::thread> readers;
  std::vector<std::thread> writers;
  Queue<int> q(16);
  for (int i = 0; i < 10; i++) {
    readers.emplace_back([&q, &sum]{
      while (auto v = q.Pop()) sum += *v;
    });
  }
  for (int i = 0; i < 5; i++) {
    writers.emplace_back([&q]{
      for (int j = 0; j < 2000; j++) ASSERT_TRUE(q.Push(1));
    });
  }
  for (auto& t : writers) t.join();
  EXPECT_TRUE(q.Flush(10000));
  q.Close();
  for (auto& t : readers) t.join();
  EXPECT_EQ(10000, sum.load());
}

TEST_F(QueueTest, CloseDrainsThenStops) {
  Queue<int> q(4);
  ASSERT_TRUE(q.Push(1));
  ASSERT_TRUE(q.Push(2));
  q.Close();
  EXPECT_FALSE(q.Push(3));
  EXPECT_EQ(1, *q.Pop());
  EXPECT_EQ(2, *q.Pop());
  EXPECT_FALSE(q.Pop().has_value());
}

}  // namespace ocw::queue
