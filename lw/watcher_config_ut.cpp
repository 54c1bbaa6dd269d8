#include "lw/watcher_config.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the default configuration is valid.
 */
TEST(watcher_config, defaults) {
  lw::watcher_config config;
  EXPECT_EQ("localhost:2379", config.etcd_address);
  EXPECT_EQ(100, config.reconnect_min_delay.count());
  EXPECT_EQ(5000, config.reconnect_max_delay.count());
  EXPECT_EQ(20, config.reconnect_max_attempts);
  EXPECT_NO_THROW(config.validate());

  std::ostringstream os;
  os << config;
  EXPECT_EQ(
      "etcd_address=localhost:2379, reconnect_min_delay=100ms, reconnect_max_delay=5000ms, reconnect_max_attempts=20",
      os.str());
}

/**
 * @test Verify that validate() rejects unusable configurations.
 */
TEST(watcher_config, validate) {
  using namespace std::chrono_literals;
  {
    lw::watcher_config config;
    config.etcd_address = "";
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    lw::watcher_config config;
    config.reconnect_min_delay = 0ms;
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    lw::watcher_config config;
    config.reconnect_min_delay = 10s;
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
  {
    lw::watcher_config config;
    config.reconnect_max_attempts = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
  }
}

/**
 * @test Verify the policies follow the configuration.
 */
TEST(watcher_config, policies) {
  using namespace std::chrono_literals;
  lw::watcher_config config;
  config.reconnect_min_delay = 10ms;
  config.reconnect_max_delay = 30ms;
  config.reconnect_max_attempts = 2;

  auto backoff = config.backoff_policy();
  EXPECT_EQ(10, backoff->on_failure().count());
  EXPECT_EQ(20, backoff->on_failure().count());
  EXPECT_EQ(30, backoff->on_failure().count());

  auto retry = config.retry_policy();
  EXPECT_TRUE(retry->on_failure());
  EXPECT_TRUE(retry->on_failure());
  EXPECT_FALSE(retry->on_failure());
}
