#include "lw/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>

/**
 * @test Verify that lw::active_completion_queue can be created, moved and destroyed.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<lw::active_completion_queue>();
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(lw::active_completion_queue());

  {
    lw::active_completion_queue orig;
    lw::active_completion_queue moved(std::move(orig));
    EXPECT_FALSE(orig);
    EXPECT_TRUE(moved);
  }

  {
    lw::active_completion_queue orig;
    EXPECT_TRUE(orig);
    lw::active_completion_queue other;
    EXPECT_TRUE(other);

    other = std::move(orig);
    EXPECT_FALSE(orig);
    EXPECT_TRUE(other);
  }

  auto cq = std::make_shared<lw::completion_queue<>>();
  std::thread t([cq]() { cq->run(); });
  EXPECT_TRUE(t.joinable());

  {
    lw::active_completion_queue owner(std::move(cq), std::move(t));
    EXPECT_TRUE(owner);
    EXPECT_FALSE(t.joinable());
  }
}

/**
 * @test Verify that timers fire in the thread owned by lw::active_completion_queue.
 */
TEST(active_completion_queue, timer_fires) {
  lw::active_completion_queue queue;
  std::promise<bool> fired;
  queue.cq().make_relative_timer(
      std::chrono::milliseconds(10), "test-timer", [&fired](auto const&, bool ok) { fired.set_value(ok); });
  auto f = fired.get_future();
  ASSERT_EQ(std::future_status::ready, f.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(f.get());
}
