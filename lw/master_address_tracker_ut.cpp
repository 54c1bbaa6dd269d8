#include "lw/master_address_tracker.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>

/**
 * @test Verify that there is no master before any value is observed.
 */
TEST(master_address_tracker, no_master_by_default) {
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  EXPECT_EQ(tracker.path(), "/cluster/master");
  EXPECT_FALSE(tracker.has_master());
  EXPECT_FALSE((bool)tracker.master_address());
  EXPECT_EQ(lw::master_address_tracker::log_identity(), "master_address_tracker");
}

/**
 * @test Verify that the address is decoded after the key is created, and is gone after it is deleted.
 */
TEST(master_address_tracker, create_and_delete) {
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  node.update("10.0.0.5:60000");
  EXPECT_TRUE(tracker.has_master());
  auto address = tracker.master_address();
  ASSERT_TRUE((bool)address);
  EXPECT_EQ(address->host(), "10.0.0.5");
  EXPECT_EQ(address->port(), 60000);

  node.clear();
  EXPECT_FALSE(tracker.has_master());
  EXPECT_FALSE((bool)tracker.master_address());
}

/**
 * @test Verify that the latest update wins.
 */
TEST(master_address_tracker, update_overwrites) {
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  node.update("a:1");
  node.update("b:2");
  auto address = tracker.master_address();
  ASSERT_TRUE((bool)address);
  EXPECT_EQ(*address, lw::server_address("b", 2));
}

/**
 * @test Verify that a malformed value is reported as an error, not as "no master".
 */
TEST(master_address_tracker, malformed_value) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  node.update("not-an-address");
  EXPECT_TRUE(tracker.has_master());
  EXPECT_THROW(tracker.master_address(), lw::malformed_address);
  EXPECT_THROW(tracker.wait_for_master(0ms), lw::malformed_address);
  EXPECT_THROW(tracker.wait_for_master(100ms), lw::malformed_address);
}

/**
 * @test Verify that a value set before the wait starts is returned without blocking.
 */
TEST(master_address_tracker, wait_value_already_present) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);
  node.update("10.0.0.5:60000");

  auto fut = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(0ms); });
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  auto address = fut.get();
  ASSERT_TRUE((bool)address);
  EXPECT_EQ(address->str(), "10.0.0.5:60000");
}

/**
 * @test Verify that wait_for_master() times out after (approximately) the requested time.
 */
TEST(master_address_tracker, wait_timeout) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  auto start = std::chrono::steady_clock::now();
  auto address = tracker.wait_for_master(100ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE((bool)address);
  EXPECT_GE(elapsed, 100ms);
  EXPECT_LT(elapsed, 5s);

  EXPECT_THROW(tracker.wait_for_master(-1ms), std::invalid_argument);
}

/**
 * @test Verify that std::chrono::milliseconds::max() waits until a master appears instead of timing out.
 */
TEST(master_address_tracker, wait_max_timeout) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  auto fut = std::async(
      std::launch::async, [&tracker]() { return tracker.wait_for_master(std::chrono::milliseconds::max()); });
  EXPECT_EQ(fut.wait_for(100ms), std::future_status::timeout);

  node.update("10.0.0.9:16000");
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  auto address = fut.get();
  ASSERT_TRUE((bool)address);
  EXPECT_EQ(*address, lw::server_address("10.0.0.9", 16000));
}

/**
 * @test Verify that two threads waiting before any value exists both receive the value.
 */
TEST(master_address_tracker, concurrent_waiters) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  auto f1 = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(0ms); });
  auto f2 = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(0ms); });
  EXPECT_EQ(f1.wait_for(20ms), std::future_status::timeout);
  EXPECT_EQ(f2.wait_for(20ms), std::future_status::timeout);

  node.update("10.0.0.7:60010");
  ASSERT_EQ(f1.wait_for(5s), std::future_status::ready);
  ASSERT_EQ(f2.wait_for(5s), std::future_status::ready);
  auto a1 = f1.get();
  auto a2 = f2.get();
  ASSERT_TRUE((bool)a1);
  ASSERT_TRUE((bool)a2);
  EXPECT_EQ(*a1, lw::server_address("10.0.0.7", 60010));
  EXPECT_EQ(*a2, *a1);
}

/**
 * @test Verify that a thread waiting for its turn still honors its own deadline.
 */
TEST(master_address_tracker, queued_waiter_timeout) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  lw::cancellation_token first_token;
  auto first = std::async(
      std::launch::async, [&tracker, first_token]() { return tracker.wait_for_master(0ms, first_token); });
  EXPECT_EQ(first.wait_for(20ms), std::future_status::timeout);

  auto start = std::chrono::steady_clock::now();
  auto second = tracker.wait_for_master(50ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE((bool)second);
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 5s);

  first_token.cancel();
  ASSERT_EQ(first.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(first.get(), lw::wait_cancelled);
}

/**
 * @test Verify that cancelling a blocked wait raises lw::wait_cancelled, and the tracker can be used afterwards.
 */
TEST(master_address_tracker, wait_cancelled) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  lw::cancellation_token token;
  auto fut = std::async(std::launch::async, [&tracker, token]() { return tracker.wait_for_master(0ms, token); });
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);
  token.cancel();
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(fut.get(), lw::wait_cancelled);

  // ... a waiter queued behind another waiter can be cancelled too ...
  auto blocking = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(0ms); });
  EXPECT_EQ(blocking.wait_for(20ms), std::future_status::timeout);
  lw::cancellation_token queued_token;
  auto queued = std::async(
      std::launch::async, [&tracker, queued_token]() { return tracker.wait_for_master(0ms, queued_token); });
  EXPECT_EQ(queued.wait_for(20ms), std::future_status::timeout);
  queued_token.cancel();
  ASSERT_EQ(queued.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(queued.get(), lw::wait_cancelled);

  // ... the serialization is released, so the remaining waiter gets the value ...
  node.update("a:1");
  ASSERT_EQ(blocking.wait_for(5s), std::future_status::ready);
  auto address = blocking.get();
  ASSERT_TRUE((bool)address);
  EXPECT_EQ(address->str(), "a:1");
  auto again = tracker.wait_for_master(0ms);
  ASSERT_TRUE((bool)again);
}

/**
 * @test Verify that stopping the watched value releases the waiters with no master.
 */
TEST(master_address_tracker, stopped) {
  using namespace std::chrono_literals;
  lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
  lw::master_address_tracker tracker(node);

  auto fut = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(0ms); });
  EXPECT_EQ(fut.wait_for(20ms), std::future_status::timeout);
  node.stop();
  ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE((bool)fut.get());
  EXPECT_FALSE((bool)tracker.wait_for_master(0ms));
}
