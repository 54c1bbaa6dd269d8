#include "lw/cancellation_token.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

/**
 * @test Verify that copies of a lw::cancellation_token share their state.
 */
TEST(cancellation_token, basic) {
  lw::cancellation_token token;
  auto copy = token;
  EXPECT_FALSE(token.cancelled());
  EXPECT_FALSE(copy.cancelled());

  copy.cancel();
  EXPECT_TRUE(token.cancelled());
  EXPECT_TRUE(copy.cancelled());

  // ... cancelling again is harmless ...
  EXPECT_NO_THROW(token.cancel());
  EXPECT_TRUE(token.cancelled());

  lw::cancellation_token other;
  EXPECT_FALSE(other.cancelled());
}

/**
 * @test Verify that callbacks are invoked exactly once, and only while subscribed.
 */
TEST(cancellation_token, callbacks) {
  lw::cancellation_token token;
  int a = 0;
  int b = 0;
  auto ta = token.subscribe([&a]() { ++a; });
  auto tb = token.subscribe([&b]() { ++b; });
  EXPECT_NE(ta, 0L);
  EXPECT_NE(tb, 0L);
  EXPECT_NE(ta, tb);

  token.unsubscribe(tb);
  token.cancel();
  token.cancel();
  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 0);

  // ... subscribing after the cancellation does not call the callback, the caller checks cancelled() ...
  int c = 0;
  auto tc = token.subscribe([&c]() { ++c; });
  EXPECT_EQ(tc, 0L);
  EXPECT_EQ(c, 0);
  EXPECT_NO_THROW(token.unsubscribe(tc));
  EXPECT_NO_THROW(token.unsubscribe(ta));
}

/**
 * @test Verify that a token can be cancelled from a different thread.
 */
TEST(cancellation_token, other_thread) {
  lw::cancellation_token token;
  std::atomic<int> calls(0);
  token.subscribe([&calls]() { ++calls; });

  std::thread t([token]() mutable { token.cancel(); });
  t.join();
  EXPECT_TRUE(token.cancelled());
  EXPECT_EQ(calls.load(), 1);
}
