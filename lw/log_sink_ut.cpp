#include "lw/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the lw::make_log_sink works as expected.
 */
TEST(log_sink, functor) {
  std::string value;
  lw::severity sev = lw::severity::trace;
  auto ls = lw::make_log_sink([&value, &sev](lw::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(lw::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, lw::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that lw::make_ostream_log_sink writes one line per message.
 */
TEST(log_sink, ostream) {
  std::ostringstream os;
  auto ls = lw::make_ostream_log_sink(os);

  ls->log(lw::severity::info, std::string("master is 10.0.0.5:60000"));
  ls->log(lw::severity::warning, std::string("master is gone"));
  ASSERT_EQ(os.str(), "master is 10.0.0.5:60000\nmaster is gone\n");
}

/**
 * @test Verify that lw::make_ostream_log_sink discards the lines below its threshold.
 */
TEST(log_sink, ostream_threshold) {
  std::ostringstream os;
  auto ls = lw::make_ostream_log_sink(os, lw::severity::warning);

  ls->log(lw::severity::info, std::string("reconnecting in 100ms"));
  ls->log(lw::severity::critical, std::string("giving up"));
  ASSERT_EQ(os.str(), "giving up\n");
}
