#include "lw/watched_value.hpp"

#include <gtest/gtest.h>

#include <future>
#include <string>
#include <thread>
#include <vector>

/**
 * @test Verify that a new lw::watched_value is empty, and that updates and deletions are recorded.
 */
TEST(watched_value, basic) {
  lw::watched_value node("/test/master", "watched_value_ut");
  EXPECT_EQ(node.path(), "/test/master");
  EXPECT_EQ(node.log_identity(), "watched_value_ut");
  EXPECT_FALSE(node.has_value());
  EXPECT_FALSE((bool)node.current_value());
  EXPECT_EQ(node.version(), 0U);

  node.update("a:1");
  ASSERT_TRUE(node.has_value());
  auto snapshot = node.current_value();
  ASSERT_TRUE((bool)snapshot);
  EXPECT_EQ(*snapshot, "a:1");

  node.update("b:2");
  EXPECT_EQ(*node.current_value(), "b:2");
  // ... snapshots are immutable, the old one is not affected by the update ...
  EXPECT_EQ(*snapshot, "a:1");

  node.clear();
  EXPECT_FALSE(node.has_value());
  EXPECT_FALSE((bool)node.current_value());
  EXPECT_EQ(node.version(), 3U);
}

/**
 * @test Verify that await_value() returns immediately if the value is already present.
 */
TEST(watched_value, await_present) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");
  node.update("10.0.0.5:60000");

  auto start = std::chrono::steady_clock::now();
  auto v = node.await_value(0ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "10.0.0.5:60000");
  EXPECT_LT(elapsed, 1s);

  v = node.await_value(10ms);
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "10.0.0.5:60000");
}

/**
 * @test Verify that await_value() times out.
 */
TEST(watched_value, await_timeout) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  auto start = std::chrono::steady_clock::now();
  auto v = node.await_value(50ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE((bool)v);
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 5s);

  EXPECT_THROW(node.await_value(-1ms), std::invalid_argument);
}

/**
 * @test Verify that await_value() wakes up when a value is set from another thread.
 */
TEST(watched_value, await_update) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  auto fut = std::async(std::launch::async, [&node]() { return node.await_value(0ms); });
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);

  // ... a deletion does not wake up the waiter ...
  node.clear();
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);

  node.update("a:1");
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  auto v = fut.get();
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "a:1");
}

/**
 * @test Verify that a timeout past the range of std::chrono::steady_clock waits until a value is present.
 */
TEST(watched_value, await_huge_timeout) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  auto now = std::chrono::steady_clock::now();
  EXPECT_TRUE(lw::detail::beyond_steady_clock(std::chrono::milliseconds::max(), now));
  EXPECT_FALSE(lw::detail::beyond_steady_clock(24h, now));

  auto fut = std::async(std::launch::async, [&node]() { return node.await_value(std::chrono::milliseconds::max()); });
  EXPECT_EQ(fut.wait_for(50ms), std::future_status::timeout);

  node.update("a:1");
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  auto v = fut.get();
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "a:1");
}

/**
 * @test Verify that cancelling a token wakes up await_value() with lw::wait_cancelled.
 */
TEST(watched_value, await_cancelled) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  lw::cancellation_token token;
  auto fut = std::async(std::launch::async, [&node, token]() { return node.await_value(0ms, token); });
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);

  token.cancel();
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(fut.get(), lw::wait_cancelled);

  // ... an already cancelled token fails immediately, unless there is a value ...
  EXPECT_THROW(node.await_value(0ms, token), lw::wait_cancelled);
  EXPECT_THROW(node.await_value(1000ms, token), lw::wait_cancelled);
  node.update("a:1");
  auto v = node.await_value(0ms, token);
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "a:1");
}

/**
 * @test Verify that stop() releases all the waiters, and later waits do not block.
 */
TEST(watched_value, stop) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  auto f1 = std::async(std::launch::async, [&node]() { return node.await_value(0ms); });
  auto f2 = std::async(std::launch::async, [&node]() { return node.await_value(0ms); });
  EXPECT_EQ(f1.wait_for(20ms), std::future_status::timeout);
  EXPECT_FALSE(node.stopped());

  node.stop();
  EXPECT_TRUE(node.stopped());
  ASSERT_EQ(f1.wait_for(5s), std::future_status::ready);
  ASSERT_EQ(f2.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE((bool)f1.get());
  EXPECT_FALSE((bool)f2.get());

  EXPECT_FALSE((bool)node.await_value(0ms));
  node.update("a:1");
  auto v = node.await_value(0ms);
  ASSERT_TRUE((bool)v);
  EXPECT_EQ(*v, "a:1");
}

/**
 * @test Verify that many threads waiting and one thread updating do not lose the update.
 */
TEST(watched_value, concurrent_waiters) {
  using namespace std::chrono_literals;
  lw::watched_value node("/test/master", "watched_value_ut");

  std::vector<std::future<lw::watched_value::value_type>> waiters;
  for (int i = 0; i != 8; ++i) {
    waiters.emplace_back(std::async(std::launch::async, [&node]() { return node.await_value(0ms); }));
  }
  std::thread updater([&node]() {
    for (int i = 0; i != 100; ++i) {
      node.update("h:" + std::to_string(i));
    }
  });
  updater.join();

  for (auto& w : waiters) {
    ASSERT_EQ(w.wait_for(5s), std::future_status::ready);
    auto v = w.get();
    ASSERT_TRUE((bool)v);
    EXPECT_EQ(v->substr(0, 2), "h:");
  }
  EXPECT_EQ(*node.current_value(), "h:99");
}
