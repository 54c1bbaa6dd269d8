//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
#include "lw/detail/reconnect_policies.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that lw::detail::exponential_backoff doubles the delay up to the maximum.
 */
TEST(reconnect_policies, exponential_backoff) {
  using namespace std::chrono_literals;
  EXPECT_THROW(lw::detail::exponential_backoff(1s, 500ms), std::invalid_argument);
  EXPECT_THROW(lw::detail::exponential_backoff(0ms, 500ms), std::invalid_argument);
  EXPECT_NO_THROW(lw::detail::exponential_backoff(1s, 1s));

  lw::detail::exponential_backoff backoff(100ms, 1s);
  EXPECT_EQ(100ms, backoff.on_failure());
  EXPECT_EQ(200ms, backoff.on_failure());
  EXPECT_EQ(400ms, backoff.on_failure());
  EXPECT_EQ(800ms, backoff.on_failure());
  EXPECT_EQ(1000ms, backoff.on_failure());
  EXPECT_EQ(1000ms, backoff.on_failure());

  // ... the watcher clones the prototype after each successful reconnect, the clone starts over ...
  auto fresh = backoff.clone();
  EXPECT_EQ(100ms, fresh->on_failure());

  std::ostringstream os;
  os << *fresh;
  EXPECT_EQ("exponential_backoff[100ms,1000ms]", os.str());
}

/**
 * @test Verify that lw::detail::limited_attempts allows exactly the configured number of attempts.
 */
TEST(reconnect_policies, limited_attempts) {
  EXPECT_THROW(lw::detail::limited_attempts(0), std::invalid_argument);
  EXPECT_THROW(lw::detail::limited_attempts(-1), std::invalid_argument);

  lw::detail::limited_attempts retry(2);
  EXPECT_TRUE(retry.on_failure());
  EXPECT_TRUE(retry.on_failure());
  EXPECT_FALSE(retry.on_failure());
  EXPECT_FALSE(retry.on_failure());

  std::ostringstream os;
  os << retry;
  EXPECT_EQ("limited_attempts[4/2]", os.str());

  auto fresh = retry.clone();
  EXPECT_TRUE(fresh->on_failure());
}
