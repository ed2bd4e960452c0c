#include "deepsearch/server/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace deepsearch::server;

// Test fixture for worker pool tests
class WorkerPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Setup code if needed
  }

  void TearDown() override {
    // Teardown code if needed
  }
};

// Test that every submitted task runs
TEST_F(WorkerPoolTest, RunsAllTasks) {
  WorkerPool pool(3);
  std::atomic<int> count(0);

  for (int i = 0; i < 20; ++i) {
    EXPECT_TRUE(pool.submit([&count]() { ++count; }));
  }
  pool.waitIdle();

  EXPECT_EQ(count.load(), 20);
  EXPECT_EQ(pool.width(), 3);
}

// Test that the pool never runs more tasks than its width
TEST_F(WorkerPoolTest, BoundedConcurrency) {
  WorkerPool pool(2);
  std::atomic<int> running(0);
  std::atomic<int> peak(0);

  for (int i = 0; i < 8; ++i) {
    pool.submit([&]() {
      int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --running;
    });
  }
  pool.waitIdle();

  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

// Test that a throwing task does not kill its worker
TEST_F(WorkerPoolTest, SurvivesThrowingTask) {
  WorkerPool pool(1);
  std::atomic<bool> ran(false);

  pool.submit([]() { throw std::runtime_error("boom"); });
  pool.submit([&ran]() { ran = true; });
  pool.waitIdle();

  EXPECT_TRUE(ran);
}

// Test stopping the pool
TEST_F(WorkerPoolTest, StopDrainsQueueAndRejectsNewTasks) {
  WorkerPool pool(1);
  std::atomic<int> count(0);

  for (int i = 0; i < 5; ++i) {
    pool.submit([&count]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++count;
    });
  }
  pool.stop();

  EXPECT_EQ(count.load(), 5);
  EXPECT_FALSE(pool.submit([&count]() { ++count; }));
  EXPECT_EQ(count.load(), 5);
}

// Test zero width is treated as one
TEST_F(WorkerPoolTest, ZeroWidth) {
  WorkerPool pool(0);
  EXPECT_EQ(pool.width(), 1);
}
