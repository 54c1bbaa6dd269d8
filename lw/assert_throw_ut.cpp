#include "lw/assert_throw.hpp"

#include <gmock/gmock.h>

#include <string>

/**
 * @test Verify that LW_ASSERT_THROW() raises only when the predicate is false.
 */
TEST(assert_throw, basic) {
  std::string stream;
  ASSERT_THROW(LW_ASSERT_THROW(not stream.empty()), lw::assertion_error);
  ASSERT_NO_THROW(LW_ASSERT_THROW(stream.empty()));
}

/**
 * @test Verify that the exception names the predicate, the location and the detail.
 */
TEST(assert_throw, message) {
  using namespace ::testing;
  try {
    int watchers = 2;
    LW_ASSERT_THROW_MSG(watchers == 1, "expected a single watcher per key");
    FAIL() << "LW_ASSERT_THROW_MSG() should have raised";
  } catch (std::runtime_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("assertion (watchers == 1) failed in TestBody()"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp:"));
    EXPECT_THAT(ex.what(), EndsWith(" - expected a single watcher per key"));
  }

  try {
    lw::raise_assertion_error("x", "f", "f.cpp", 7, "");
    FAIL() << "raise_assertion_error() should have raised";
  } catch (lw::assertion_error const& ex) {
    EXPECT_STREQ("assertion (x) failed in f() at f.cpp:7", ex.what());
  }
}
