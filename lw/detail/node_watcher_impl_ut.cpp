#include "lw/detail/node_watcher_impl.hpp"
#include <lw/detail/mocked_grpc_interceptor.hpp>
#include <lw/detail/reconnect_policies.hpp>
#include <lw/master_address_tracker.hpp>

#include <gmock/gmock.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {
using namespace std::chrono_literals;

using completion_queue_type = lw::completion_queue<lw::detail::mocked_grpc_interceptor>;
using watcher_type = lw::detail::node_watcher_impl<completion_queue_type>;
using base_op_ptr = std::shared_ptr<lw::detail::base_async_op>;

/// Create a mock action that responds to a Range request.
auto range_returns(std::int64_t revision, std::string value) {
  return [revision, value](base_op_ptr bop) {
    auto* op = dynamic_cast<watcher_type::range_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.mutable_header()->set_revision(revision);
    if (not value.empty()) {
      auto& kv = *op->response.add_kvs();
      kv.set_key(op->request.key());
      kv.set_value(value);
      kv.set_mod_revision(revision);
    }
    bop->complete(true);
  };
}

/// Create a mock action where a Range request fails.
auto range_fails() {
  return [](base_op_ptr bop) {
    auto* op = dynamic_cast<watcher_type::range_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "mocked etcd is down");
    bop->complete(true);
  };
}

etcdserverpb::WatchResponse put_event(std::string const& key, std::string const& value, std::int64_t revision) {
  etcdserverpb::WatchResponse response;
  auto& ev = *response.add_events();
  ev.set_type(mvccpb::Event::PUT);
  ev.mutable_kv()->set_key(key);
  ev.mutable_kv()->set_value(value);
  ev.mutable_kv()->set_mod_revision(revision);
  return response;
}

etcdserverpb::WatchResponse delete_event(std::string const& key, std::int64_t revision) {
  etcdserverpb::WatchResponse response;
  auto& ev = *response.add_events();
  ev.set_type(mvccpb::Event::DELETE);
  ev.mutable_kv()->set_key(key);
  ev.mutable_kv()->set_mod_revision(revision);
  return response;
}

class node_watcher_impl_test : public ::testing::Test {
protected:
  node_watcher_impl_test()
      : queue()
      , node("/test/hbase/master", lw::master_address_tracker::log_identity())
      , backoff(10ms, 40ms)
      , retry(2) {
  }

  std::unique_ptr<watcher_type> make_watcher() {
    return std::make_unique<watcher_type>(
        queue, std::unique_ptr<etcdserverpb::KV::Stub>(), std::unique_ptr<etcdserverpb::Watch::Stub>(), node,
        lw::make_abortable([this](std::string const& why) { abort_reasons.push_back(why); }), backoff, retry);
  }

  /// Setup the mock to create streams and watches, and to keep the Read() operations pending.
  void expect_stream_operations() {
    using namespace ::testing;
    auto& mock = *queue.interceptor().shared_mock;
    EXPECT_CALL(mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke([this](base_op_ptr bop) {
      ++streams_created;
      bop->complete(true);
    }));
    EXPECT_CALL(mock, async_write(_)).WillRepeatedly(Invoke([this](base_op_ptr bop) {
      auto* op = dynamic_cast<watcher_type::watch_write_op*>(bop.get());
      ASSERT_TRUE(op != nullptr);
      ASSERT_TRUE(op->request.has_create_request());
      EXPECT_EQ(node.path(), op->request.create_request().key());
      start_revisions.push_back(op->request.create_request().start_revision());
      bop->complete(true);
    }));
    EXPECT_CALL(mock, async_read(_)).WillRepeatedly(Invoke([this](base_op_ptr bop) { pending_reads.push_back(bop); }));
    EXPECT_CALL(mock, async_finish(_)).WillRepeatedly(Invoke([](base_op_ptr bop) {
      auto* op = dynamic_cast<lw::detail::stream_finish_op*>(bop.get());
      ASSERT_TRUE(op != nullptr);
      op->status = grpc::Status(grpc::UNAVAILABLE, "mocked stream broken");
      bop->complete(true);
    }));
    EXPECT_CALL(mock, make_deadline_timer(_)).WillRepeatedly(Invoke([this](base_op_ptr bop) {
      pending_timers.push_back(bop);
    }));
    // ... cancelling the stream completes the pending Read() operations ...
    EXPECT_CALL(mock, try_cancel()).WillRepeatedly(Invoke([this]() {
      auto reads = std::move(pending_reads);
      pending_reads.clear();
      for (auto& bop : reads) {
        bop->complete(false);
      }
    }));
  }

  /// Complete the oldest pending Read() with @a response.
  void complete_read(etcdserverpb::WatchResponse const& response) {
    ASSERT_FALSE(pending_reads.empty());
    auto bop = pending_reads.front();
    pending_reads.erase(pending_reads.begin());
    auto* op = dynamic_cast<watcher_type::watch_read_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response = response;
    bop->complete(true);
  }

  /// Complete the oldest pending Read() with an error, as if the stream broke.
  void fail_read() {
    ASSERT_FALSE(pending_reads.empty());
    auto bop = pending_reads.front();
    pending_reads.erase(pending_reads.begin());
    bop->complete(false);
  }

  /// Fire (or cancel) the oldest pending timer.
  void fire_timer(bool ok) {
    ASSERT_FALSE(pending_timers.empty());
    auto bop = pending_timers.front();
    pending_timers.erase(pending_timers.begin());
    bop->complete(ok);
  }

  completion_queue_type queue;
  lw::watched_value node;
  lw::detail::exponential_backoff backoff;
  lw::detail::limited_attempts retry;

  int streams_created = 0;
  std::vector<std::int64_t> start_revisions;
  std::vector<base_op_ptr> pending_reads;
  std::vector<base_op_ptr> pending_timers;
  std::vector<std::string> abort_reasons;
};
} // anonymous namespace

/**
 * @test Verify that startup() publishes the current value and watches from the next revision.
 */
TEST_F(node_watcher_impl_test, startup_with_value) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke(range_returns(10, "host1:16000")));
  expect_stream_operations();

  auto watcher = make_watcher();
  EXPECT_EQ("/test/hbase/master", watcher->path());
  watcher->startup();

  auto value = node.current_value();
  ASSERT_TRUE((bool)value);
  EXPECT_EQ("host1:16000", *value);
  EXPECT_EQ(10, watcher->revision());
  EXPECT_EQ(1, streams_created);
  ASSERT_EQ(1UL, start_revisions.size());
  EXPECT_EQ(11, start_revisions[0]);
  EXPECT_EQ(1UL, pending_reads.size());

  watcher->shutdown();
  EXPECT_TRUE(pending_reads.empty());
  EXPECT_TRUE(node.stopped());
  EXPECT_TRUE(abort_reasons.empty());
}

/**
 * @test Verify that PUT and DELETE events update and clear the value, in order.
 */
TEST_F(node_watcher_impl_test, events_update_value) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke(range_returns(7, "")));
  expect_stream_operations();

  auto watcher = make_watcher();
  watcher->startup();
  lw::master_address_tracker tracker(node);
  EXPECT_FALSE(tracker.has_master());
  EXPECT_FALSE((bool)tracker.master_address());
  ASSERT_EQ(1UL, start_revisions.size());
  EXPECT_EQ(8, start_revisions[0]);

  etcdserverpb::WatchResponse created;
  created.set_created(true);
  created.set_watch_id(1);
  complete_read(created);
  EXPECT_FALSE(tracker.has_master());

  complete_read(put_event(node.path(), "host1:16000", 9));
  auto master = tracker.master_address();
  ASSERT_TRUE((bool)master);
  EXPECT_EQ(lw::server_address("host1", 16000), *master);
  EXPECT_EQ(9, watcher->revision());

  // ... several events in one response are applied in order ...
  auto response = put_event(node.path(), "host2:16000", 10);
  *response.add_events() = put_event(node.path(), "host3:16020", 11).events(0);
  complete_read(response);
  master = tracker.master_address();
  ASSERT_TRUE((bool)master);
  EXPECT_EQ(lw::server_address("host3", 16020), *master);

  complete_read(delete_event(node.path(), 12));
  EXPECT_FALSE(tracker.has_master());
  EXPECT_FALSE((bool)tracker.master_address());
  EXPECT_EQ(12, watcher->revision());

  // ... a waiter blocked before the PUT is released by it ...
  std::promise<std::unique_ptr<lw::server_address>> result;
  std::thread waiter([&tracker, &result]() { result.set_value(tracker.wait_for_master(5s)); });
  complete_read(put_event(node.path(), "host4:16000", 13));
  waiter.join();
  auto waited = result.get_future().get();
  ASSERT_TRUE((bool)waited);
  EXPECT_EQ(lw::server_address("host4", 16000), *waited);

  watcher->shutdown();
  EXPECT_TRUE(abort_reasons.empty());
}

/**
 * @test Verify that startup() raises if the initial Range request fails.
 */
TEST_F(node_watcher_impl_test, startup_failure) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke(range_fails()));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).Times(0);

  auto watcher = make_watcher();
  EXPECT_THROW(watcher->startup(), lw::etcd_error);
  EXPECT_FALSE(node.has_value());
  EXPECT_NO_THROW(watcher.reset());
  EXPECT_TRUE(node.stopped());
}

/**
 * @test Verify that a compacted or cancelled watch re-reads the key and watches again.
 */
TEST_F(node_watcher_impl_test, compaction_resync) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke(range_returns(10, "host1:16000")))
      .WillOnce(Invoke(range_returns(20, "host2:16000")));
  expect_stream_operations();

  auto watcher = make_watcher();
  watcher->startup();

  etcdserverpb::WatchResponse compacted;
  compacted.set_canceled(true);
  compacted.set_compact_revision(15);
  compacted.set_cancel_reason("mvcc: required revision has been compacted");
  complete_read(compacted);

  auto value = node.current_value();
  ASSERT_TRUE((bool)value);
  EXPECT_EQ("host2:16000", *value);
  EXPECT_EQ(20, watcher->revision());
  // ... the watch is created again on the same stream ...
  EXPECT_EQ(1, streams_created);
  ASSERT_EQ(2UL, start_revisions.size());
  EXPECT_EQ(21, start_revisions[1]);
  EXPECT_EQ(1UL, pending_reads.size());

  watcher->shutdown();
  EXPECT_TRUE(abort_reasons.empty());
}

/**
 * @test Verify that a broken stream reconnects, and the failure count starts over after a successful reconnect.
 */
TEST_F(node_watcher_impl_test, reconnect) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke(range_returns(10, "host1:16000")))
      .WillOnce(Invoke(range_returns(30, "host2:16000")))
      .WillRepeatedly(Invoke(range_fails()));
  expect_stream_operations();

  auto watcher = make_watcher();
  watcher->startup();

  fail_read();
  ASSERT_EQ(1UL, pending_timers.size());
  EXPECT_EQ(1, streams_created);

  fire_timer(true);
  EXPECT_EQ(2, streams_created);
  ASSERT_EQ(2UL, start_revisions.size());
  EXPECT_EQ(31, start_revisions[1]);
  auto value = node.current_value();
  ASSERT_TRUE((bool)value);
  EXPECT_EQ("host2:16000", *value);

  etcdserverpb::WatchResponse created;
  created.set_created(true);
  complete_read(created);

  // ... two more failures are tolerated, the count started over when the watch was created ...
  fail_read();
  fire_timer(true);
  EXPECT_TRUE(abort_reasons.empty());
  EXPECT_FALSE(node.stopped());
  ASSERT_EQ(1UL, pending_timers.size());

  // ... the last timer is cancelled, as it would be during shutdown ...
  fire_timer(false);
  watcher->shutdown();
  EXPECT_TRUE(abort_reasons.empty());
}

/**
 * @test Verify that the abort handler is called once the retry policy is exhausted.
 */
TEST_F(node_watcher_impl_test, abort_after_retries) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke(range_returns(10, "host1:16000")))
      .WillRepeatedly(Invoke(range_fails()));
  expect_stream_operations();

  auto watcher = make_watcher();
  watcher->startup();
  lw::master_address_tracker tracker(node);

  fail_read();
  fire_timer(true);
  EXPECT_TRUE(abort_reasons.empty());
  fire_timer(true);
  EXPECT_TRUE(pending_timers.empty());
  ASSERT_EQ(1UL, abort_reasons.size());
  EXPECT_THAT(abort_reasons[0], HasSubstr("/test/hbase/master"));
  EXPECT_THAT(abort_reasons[0], HasSubstr("limited_attempts[3/2]"));

  // ... the last known value remains, but waiters are not blocked anymore ...
  EXPECT_TRUE(node.stopped());
  EXPECT_TRUE(tracker.has_master());
  auto master = tracker.wait_for_master(0ms);
  ASSERT_TRUE((bool)master);
  EXPECT_EQ(lw::server_address("host1", 16000), *master);

  watcher->shutdown();
  EXPECT_EQ(1UL, abort_reasons.size());
}

/**
 * @test Verify that a failed Range during re-synchronization cancels the stream and reconnects.
 */
TEST_F(node_watcher_impl_test, resync_failure_reconnects) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke(range_returns(10, "host1:16000")))
      .WillOnce(Invoke(range_fails()))
      .WillOnce(Invoke(range_returns(40, "")));
  expect_stream_operations();

  auto watcher = make_watcher();
  watcher->startup();

  etcdserverpb::WatchResponse cancelled;
  cancelled.set_canceled(true);
  complete_read(cancelled);
  ASSERT_EQ(1UL, pending_timers.size());

  fire_timer(true);
  EXPECT_EQ(2, streams_created);
  EXPECT_FALSE(node.has_value());
  ASSERT_EQ(2UL, start_revisions.size());
  EXPECT_EQ(41, start_revisions[1]);

  watcher->shutdown();
  EXPECT_TRUE(abort_reasons.empty());
}
