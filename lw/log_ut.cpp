#include "lw/log.hpp"

#include <gmock/gmock.h>

#include <type_traits>
#include <utility>
#include <vector>

namespace {
using captured_logs = std::vector<std::pair<lw::severity, std::string>>;

std::shared_ptr<lw::log_sink> capture_to(captured_logs& logs) {
  return lw::make_log_sink([&logs](lw::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the LW_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  lw::log lg;
  // First what basically amounts to a compilation test
  ASSERT_NO_THROW(LW_LOG_I(error, lg, "") << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LW_LOG_I(error, lg, "") << "testing 123"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, lw::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
}

/**
 * @test Verify that the identity of a log line is included in the message.
 */
TEST(log, identity) {
  lw::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LW_LOG_I(warning, lg, "master_address_tracker") << "node deleted");
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_THAT(logs[0].second, StartsWith("[warning] [master_address_tracker] node deleted"));
  ASSERT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that the LW_LOG_I() and the supporting classes all work when a log level is disabled.
 */
TEST(log, run_time_disable) {
  lw::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LW_LOG_I(info, lg, "") << "testing 123"
                                         << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, lw::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(lw::severity::warning);
  ASSERT_EQ(lg.min_severity(), lw::severity::warning);
  ASSERT_NO_THROW(LW_LOG_I(info, lg, "") << "testing 123"
                                         << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  // ... also verify that disabled expressions are not even called ...
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that the LW_LOG_I() and the supporting classes all work when a log level is disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  lw::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at runtime, but disabled at compile-time ...
  lg.min_severity(lw::severity::trace);
  ASSERT_NO_THROW(LW_LOG_I(debug, lg, "") << "testing 123"
                                          << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
}

/**
 * @test Verify that the LW_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  lw::log& lg = lw::log::instance();
  captured_logs logs;
  auto token = lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(LW_LOG(info) << "testing 123 " << 42);
  ASSERT_NO_THROW(LW_LOG_AS(info, "watcher") << "testing 234");
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, lw::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("[info] [watcher] testing 234"));
  ASSERT_NO_THROW(lg.remove_sink(token));
}

/**
 * @test Verify that the LW_LOG_I() and the supporting classes work with multiple sinks.
 */
TEST(log, multiple_sinks) {
  lw::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(lw::make_log_sink([&logs](lw::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(LW_LOG_I(error, lg, "") << "testing 123"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, lw::severity::error);
  ASSERT_EQ(logs[1].first, lw::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));
}

/**
 * @test Verify that a single sink can be removed.
 */
TEST(log, remove_sink) {
  lw::log lg;
  captured_logs first;
  captured_logs second;
  auto t1 = lg.add_sink(capture_to(first));
  auto t2 = lg.add_sink(capture_to(second));
  ASSERT_NE(t1, t2);

  LW_LOG_I(error, lg, "") << "both";
  lg.remove_sink(t1);
  LW_LOG_I(error, lg, "") << "only second";
  // ... removing an unknown token is harmless ...
  ASSERT_NO_THROW(lg.remove_sink(t1));

  EXPECT_EQ(first.size(), 1UL);
  EXPECT_EQ(second.size(), 2UL);

  lg.clear_sinks();
  LW_LOG_I(error, lg, "") << "nobody";
  EXPECT_EQ(second.size(), 2UL);
}

/**
 * @test Verify that lw::log::enabled() considers both the threshold and the sinks.
 */
TEST(log, enabled) {
  lw::log lg;
  EXPECT_FALSE(lg.enabled(lw::severity::fatal));

  captured_logs logs;
  auto token = lg.add_sink(capture_to(logs));
  EXPECT_TRUE(lg.enabled(lw::severity::trace));
  lg.min_severity(lw::severity::error);
  EXPECT_FALSE(lg.enabled(lw::severity::warning));
  EXPECT_TRUE(lg.enabled(lw::severity::error));

  lg.remove_sink(token);
  EXPECT_FALSE(lg.enabled(lw::severity::error));
}

/**
 * @test Verify that a compile-time disabled lw::log_line never writes anything.
 */
TEST(log, log_line_disabled) {
  // ... LW_LOG() never calls get() or write_to() on these, but they must compile and do nothing ...
  lw::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lw::log_line<true> line(lw::severity::error, __func__, __FILE__, __LINE__, lg, "watcher");

  ASSERT_FALSE((bool)line);
  ASSERT_NO_THROW(line.get() << "revision " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(line.get()), lw::detail::null_stream&>::value));
  ASSERT_NO_THROW(line.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
