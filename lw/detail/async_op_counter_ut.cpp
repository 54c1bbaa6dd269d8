#include "lw/detail/async_op_counter.hpp"

#include <gmock/gmock.h>

#include <string>
#include <thread>

/**
 * @test Verify that lw::detail::async_op_counter tracks operations by name and blocks until they are done.
 */
TEST(async_op_counter, basic) {
  using namespace ::testing;
  lw::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start("/master/read"));
  EXPECT_TRUE(counter.async_op_start("/master/create_watch", " start_revision=", 42));
  EXPECT_TRUE(counter.async_op_start("/master/read"));
  EXPECT_EQ(3U, counter.pending());
  EXPECT_THAT(counter.pending_names(), ElementsAre("/master/create_watch", "/master/read", "/master/read"));

  counter.async_op_done("/master/read");
  counter.async_op_done("/master/create_watch", " revision in hex=", std::hex, 42);
  EXPECT_THAT(counter.pending_names(), ElementsAre("/master/read"));

  // ... an unknown name is logged and ignored ...
  counter.async_op_done("/master/finish");
  EXPECT_EQ(1U, counter.pending());

  EXPECT_FALSE(counter.in_shutdown());
  counter.shutdown();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start("/master/reconnect/timer"));
  EXPECT_EQ(1U, counter.pending());

  std::thread t([&counter]() { counter.async_op_done("/master/read"); });
  counter.block_until_all_done();
  EXPECT_EQ(0U, counter.pending());
  t.join();
}

/**
 * @test Verify that block_until_all_done() returns immediately without pending operations.
 */
TEST(async_op_counter, nothing_pending) {
  lw::detail::async_op_counter counter;
  counter.block_until_all_done();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start("/master/read"));
}
