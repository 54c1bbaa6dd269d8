#include "lw/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

/**
 * @test Verify that we can run and shutdown a completion queue.
 */
TEST(base_completion_queue, run_shutdown) {
  lw::detail::base_completion_queue queue;
  EXPECT_EQ(0U, queue.pending_operations());

  std::promise<void> start;
  std::promise<void> end;
  std::thread t([&]() {
    start.set_value();
    queue.run();
    end.set_value();
  });

  using namespace std::chrono_literals;
  ASSERT_EQ(std::future_status::ready, start.get_future().wait_for(500ms));

  queue.shutdown();
  // ... a second shutdown() is harmless ...
  queue.shutdown();
  ASSERT_EQ(std::future_status::ready, end.get_future().wait_for(2s));

  t.join();
}

/**
 * @test Verify that run() returns immediately on a queue already shutdown.
 */
TEST(base_completion_queue, run_after_shutdown) {
  lw::detail::base_completion_queue queue;
  queue.shutdown();
  queue.run();
  SUCCEED();
}
