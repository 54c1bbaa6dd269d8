#include "lw/detail/null_stream.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <iomanip>
#include <string>

/**
 * @test Verify that lw::detail::null_stream accepts the expressions used in the watcher log lines.
 */
TEST(null_stream, watcher_log_expressions) {
  lw::detail::null_stream n;

  std::int64_t revision = 42;
  auto& r = n << "watch on /cluster/master created at revision " << revision << std::endl;
  EXPECT_EQ(&n, &r);
  EXPECT_NO_THROW(n << "master at " << std::string("10.0.0.5") << ":" << 60000);
  EXPECT_NO_THROW(n << "reconnect in " << std::chrono::milliseconds(100).count() << "ms");
  EXPECT_NO_THROW(n << "tag=" << std::hex << 0xdeadbeef << std::dec << std::flush);
}
