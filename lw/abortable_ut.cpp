#include "lw/abortable.hpp"

#include <gtest/gtest.h>

#include <vector>

/**
 * @test Verify that lw::make_abortable() adapts lambdas and other functors.
 */
TEST(abortable, make_abortable) {
  std::vector<std::string> reasons;
  auto handler = lw::make_abortable([&reasons](std::string const& why) { reasons.push_back(why); });
  ASSERT_TRUE((bool)handler);
  handler->abort("etcd unreachable");
  handler->abort("retry policy exhausted");
  ASSERT_EQ(2UL, reasons.size());
  EXPECT_EQ("etcd unreachable", reasons[0]);
  EXPECT_EQ("retry policy exhausted", reasons[1]);

  // ... lvalue functors are copied into the adaptor ...
  int count = 0;
  auto counter = [&count](std::string const&) { ++count; };
  auto h2 = lw::make_abortable(counter);
  h2->abort("one");
  h2->abort("two");
  EXPECT_EQ(2, count);
}
