#include "lw/completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>

namespace lw {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace lw

/**
 * @test Verify that timers fire, and cancelled timers report ok == false.
 */
TEST(completion_queue, timers) {
  lw::completion_queue<> queue;

  std::atomic<int> fired(0);
  std::atomic<int> cancelled(0);
  auto functor = [&fired, &cancelled](auto const& op, bool ok) {
    if (ok) {
      ++fired;
    } else {
      ++cancelled;
    }
  };

  using namespace std::chrono_literals;

  auto c = queue.make_relative_timer(5s, "test-cancelled", functor);
  auto timer = queue.make_relative_timer(5ms, "test-timer", functor);
  EXPECT_EQ(2U, queue.pending_operations());
  auto names = queue.describe_pending_operations();
  EXPECT_NE(std::string::npos, names.find("test-cancelled\n"));
  EXPECT_NE(std::string::npos, names.find("test-timer\n"));
  c->cancel();
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and (fired.load() == 0 or cancelled.load() == 0); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(1, fired.load());
  EXPECT_EQ(1, cancelled.load());
  EXPECT_EQ(0U, queue.pending_operations());

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that lw::completion_queue ignores null and unknown tags.
 */
TEST(completion_queue, unknown_tags) {
  using namespace std::chrono_literals;

  lw::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  grpc::CompletionQueue* cq = lw::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto op = queue.make_relative_timer(30ms, "alarm-after", [&cnt](auto const&, bool) { ++cnt; });
  grpc::Alarm null_tag;
  null_tag.Set(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  grpc::Alarm unknown_tag;
  unknown_tag.Set(cq, std::chrono::system_clock::now() + 20ms, static_cast<void*>(&cnt));

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(1, cnt.load());

  queue.shutdown();
  t.join();
}
