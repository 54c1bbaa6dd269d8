#include "lw/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(log_severity, base) {
  ASSERT_LT(lw::severity::LOWEST, lw::severity::HIGHEST);

  using s = lw::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that lw::parse_severity() is the inverse of the streaming operator.
 */
TEST(log_severity, parse) {
  using s = lw::severity;
  EXPECT_EQ(lw::parse_severity("trace"), s::trace);
  EXPECT_EQ(lw::parse_severity("warning"), s::warning);
  EXPECT_EQ(lw::parse_severity("fatal"), s::fatal);
  EXPECT_THROW(lw::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(lw::parse_severity(""), std::invalid_argument);
}
