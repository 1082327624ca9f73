#include "bounded_queue.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tcpgraph;
using std::chrono::milliseconds;

TEST(BoundedQueue, FifoOrder) {
  BoundedQueue<int> q(8);
  for (int i = 0; i < 5; i++) ASSERT_TRUE(q.push(i));
  int v = -1;
  for (int i = 0; i < 5; i++) {
    ASSERT_EQ(q.pop(v), PopResult::kItem);
    EXPECT_EQ(v, i);
  }
}

TEST(BoundedQueue, ProducerBlocksWhenFull) {
  BoundedQueue<int> q(2);
  std::atomic<int> pushed{0};
  std::thread producer([&] {
    for (int i = 0; i < 5; i++) {
      if (!q.push(i)) return;
      pushed++;
    }
  });
  std::this_thread::sleep_for(milliseconds(100));
  // Saturated: capacity reached, producer parked on the third push.
  EXPECT_EQ(pushed.load(), 2);
  EXPECT_EQ(q.size(), 2u);

  std::vector<int> got;
  int v = 0;
  while (got.size() < 5 && q.pop_for(v, milliseconds(1000)) == PopResult::kItem) got.push_back(v);
  producer.join();
  EXPECT_EQ(pushed.load(), 5);
  EXPECT_EQ(got, (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(q.dropped(), 0u);
}

TEST(BoundedQueue, CloseReleasesBlockedProducer) {
  BoundedQueue<int> q(1);
  ASSERT_TRUE(q.push(1));
  std::atomic<bool> result{true};
  std::thread producer([&] { result = q.push(2); });
  std::this_thread::sleep_for(milliseconds(50));
  q.close();
  producer.join();
  EXPECT_FALSE(result.load());
  EXPECT_FALSE(q.try_push(3));
}

TEST(BoundedQueue, PopDrainsThenReportsClosed) {
  BoundedQueue<int> q(4);
  q.push(7);
  q.push(8);
  q.close();
  q.close();
  int v = 0;
  EXPECT_EQ(q.pop(v), PopResult::kItem);
  EXPECT_EQ(v, 7);
  EXPECT_EQ(q.pop_for(v, milliseconds(10)), PopResult::kItem);
  EXPECT_EQ(v, 8);
  EXPECT_EQ(q.pop(v), PopResult::kClosed);
  EXPECT_TRUE(q.closed());
}

TEST(BoundedQueue, PopTimesOutWhenEmpty) {
  BoundedQueue<int> q(1);
  int v = 0;
  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(q.pop_for(v, milliseconds(30)), PopResult::kTimeout);
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(30));
}

TEST(BoundedQueue, CloseWakesBlockedConsumer) {
  BoundedQueue<int> q(1);
  std::atomic<int> r{-1};
  std::thread consumer([&] {
    int v = 0;
    r = static_cast<int>(q.pop(v));
  });
  std::this_thread::sleep_for(milliseconds(30));
  q.close();
  consumer.join();
  EXPECT_EQ(r.load(), static_cast<int>(PopResult::kClosed));
}

TEST(BoundedQueue, TryPushFailsWhenFull) {
  BoundedQueue<int> q(1);
  EXPECT_TRUE(q.try_push(1));
  EXPECT_FALSE(q.try_push(2));
  EXPECT_EQ(q.size(), 1u);
}

TEST(BoundedQueue, DropOldestKeepsNewest) {
  BoundedQueue<int> q(2);
  for (int i = 1; i <= 5; i++) EXPECT_TRUE(q.push_drop_oldest(i));
  EXPECT_EQ(q.size(), 2u);
  EXPECT_EQ(q.dropped(), 3u);
  int v = 0;
  q.pop(v);
  EXPECT_EQ(v, 4);
  q.pop(v);
  EXPECT_EQ(v, 5);
  q.close();
  EXPECT_FALSE(q.push_drop_oldest(6));
}

TEST(BoundedQueue, ZeroCapacityRejected) {
  EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}
