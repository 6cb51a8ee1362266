/**
 * @file test_request_queue.cpp
 * @brief Unit tests for the queue between callers and the D-Bus worker
 */

#include "platform/linux/request_queue.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace directlink::platform;

TEST(RequestQueueTest, RunsRequestsInOrder) {
  RequestQueue queue;
  std::vector<int> order;

  queue.push([&]() { order.push_back(1); });
  queue.push([&]() { order.push_back(2); });
  EXPECT_TRUE(order.empty());

  queue.run_all();
  EXPECT_EQ(order, (std::vector<int>{1, 2}));

  // Nothing left to run
  queue.run_all();
  EXPECT_EQ(order.size(), 2u);
}

TEST(RequestQueueTest, RequestQueuedWhileRunningIsRun) {
  RequestQueue queue;
  int runs = 0;

  queue.push([&]() {
    ++runs;
    queue.push([&]() { ++runs; });
  });

  queue.run_all();
  EXPECT_EQ(runs, 2);
}

TEST(RequestQueueTest, CloseAbandonsQueuedRequests) {
  RequestQueue queue;
  std::vector<std::string> outcome;

  queue.push([&]() { outcome.push_back("ran find"); },
             [&]() { outcome.push_back("abandoned find"); });
  queue.push([&]() { outcome.push_back("ran peers"); },
             [&]() { outcome.push_back("abandoned peers"); });

  queue.close();
  EXPECT_TRUE(queue.closed());
  EXPECT_EQ(outcome, (std::vector<std::string>{"abandoned find",
                                               "abandoned peers"}));

  queue.run_all();
  EXPECT_EQ(outcome.size(), 2u);
}

TEST(RequestQueueTest, RequestAfterCloseIsAbandonedImmediately) {
  RequestQueue queue;
  queue.close();

  bool ran = false;
  bool abandoned = false;
  queue.push([&]() { ran = true; }, [&]() { abandoned = true; });

  EXPECT_TRUE(abandoned);
  queue.run_all();
  EXPECT_FALSE(ran);
}

TEST(RequestQueueTest, RequestWithoutAbandonIsDroppedOnClose) {
  RequestQueue queue;
  bool ran = false;

  queue.push([&]() { ran = true; });
  queue.close();
  queue.push([&]() { ran = true; });

  queue.run_all();
  EXPECT_FALSE(ran);
}
