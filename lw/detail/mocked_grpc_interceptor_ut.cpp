#include "lw/detail/mocked_grpc_interceptor.hpp"
#include <lw/completion_queue.hpp>

#include <etcdserverpb/rpc.grpc.pb.h>

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using completion_queue_type = lw::completion_queue<lw::detail::mocked_grpc_interceptor>;
using watch_stream_type = lw::detail::rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;

/**
 * @test Verify that timers can be mocked, and completed when the test decides.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;

  std::vector<std::shared_ptr<lw::detail::deadline_timer>> pending_timers;
  auto save_timer = [&pending_timers](auto bop) {
    auto timer = std::dynamic_pointer_cast<lw::detail::deadline_timer>(bop);
    ASSERT_TRUE((bool)timer);
    pending_timers.push_back(std::move(timer));
  };
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke(save_timer));

  int fired = 0;
  int cancelled = 0;
  auto handle_timer = [&fired, &cancelled](auto const&, bool ok) {
    if (ok) {
      ++fired;
    } else {
      ++cancelled;
    }
  };
  queue.make_relative_timer(100ms, "testing/relative_timer", handle_timer);
  ASSERT_EQ(1UL, pending_timers.size());
  EXPECT_EQ("testing/relative_timer", pending_timers[0]->name);
  EXPECT_EQ(0, fired);
  pending_timers[0]->complete(true);
  EXPECT_EQ(1, fired);
  EXPECT_EQ(0, cancelled);
  pending_timers.clear();

  auto deadline = std::chrono::system_clock::now() + 100ms;
  queue.make_deadline_timer(deadline, "testing/deadline_timer", handle_timer);
  ASSERT_EQ(1UL, pending_timers.size());
  EXPECT_EQ(deadline, pending_timers[0]->deadline);
  pending_timers[0]->complete(false);
  EXPECT_EQ(1, fired);
  EXPECT_EQ(1, cancelled);
}

/**
 * @test Verify that async_rpc() calls can be mocked, including the response contents.
 */
TEST(mocked_grpc_interceptor, async_rpc) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  // ... mocked operations never use the stub ...
  std::unique_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  std::shared_ptr<lw::detail::base_async_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) {
    last_op = op;
  }));

  etcdserverpb::RangeRequest req;
  req.set_key("/master");
  auto fut = queue.async_rpc(kv.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "test/Range", lw::use_future());
  EXPECT_EQ(std::future_status::timeout, fut.wait_for(10ms));

  ASSERT_TRUE((bool)last_op);
  using op_type = lw::detail::unary_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
  auto* op = dynamic_cast<op_type*>(last_op.get());
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ("/master", op->request.key());
  op->response.mutable_header()->set_revision(7);
  op->response.add_kvs()->set_value("localhost:2181");
  last_op->complete(true);

  ASSERT_EQ(std::future_status::ready, fut.wait_for(0ms));
  auto response = fut.get();
  EXPECT_EQ(7, response.header().revision());
  ASSERT_EQ(1, response.kvs_size());
  EXPECT_EQ("localhost:2181", response.kvs(0).value());
}

/**
 * @test Verify that cancelled and failed RPCs raise exceptions through the future.
 */
TEST(mocked_grpc_interceptor, async_rpc_errors) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  std::unique_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke([](auto bop) { bop->complete(false); }))
      .WillOnce(Invoke([](auto bop) {
        using op_type = lw::detail::unary_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
        auto* op = dynamic_cast<op_type*>(bop.get());
        op->status = grpc::Status(grpc::UNAVAILABLE, "mocked failure");
        bop->complete(true);
      }));

  auto cancelled = queue.async_rpc(
      kv.get(), &etcdserverpb::KV::Stub::AsyncRange, etcdserverpb::RangeRequest(), "test/Range/cancelled",
      lw::use_future());
  ASSERT_EQ(std::future_status::ready, cancelled.wait_for(0ms));
  EXPECT_THROW(cancelled.get(), std::runtime_error);

  auto failed = queue.async_rpc(
      kv.get(), &etcdserverpb::KV::Stub::AsyncRange, etcdserverpb::RangeRequest(), "test/Range/failed",
      lw::use_future());
  ASSERT_EQ(std::future_status::ready, failed.wait_for(0ms));
  EXPECT_THROW(failed.get(), lw::etcd_error);
}

/**
 * @test Verify creation of rdwr RPC streams is intercepted.
 */
TEST(mocked_grpc_interceptor, create_rdwr_stream) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  std::unique_ptr<etcdserverpb::Watch::Stub> watch;
  completion_queue_type queue;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_))
      .WillOnce(Invoke([](auto op) { op->complete(true); }))
      .WillOnce(Invoke([](auto op) { op->complete(false); }))
      .WillOnce(Invoke([](auto op) { op->complete(true); }));

  auto fut = queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/Watch/future", lw::use_future());
  ASSERT_EQ(std::future_status::ready, fut.wait_for(0ms));
  EXPECT_TRUE((bool)fut.get());

  auto cancelled = queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/Watch/future/cancelled", lw::use_future());
  ASSERT_EQ(std::future_status::ready, cancelled.wait_for(0ms));
  EXPECT_THROW(cancelled.get(), std::exception);

  int counter = 0;
  queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/Watch/functor",
      [&counter](auto stream, bool ok) { counter += int(ok and (bool)stream); });
  EXPECT_EQ(1, counter);
}

/**
 * @test Verify Write(), Read(), Finish() and TryCancel() on rdwr RPC streams are intercepted.
 */
TEST(mocked_grpc_interceptor, rdwr_stream_ops) {
  using namespace ::testing;

  completion_queue_type queue;
  watch_stream_type stream;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lw::detail::stream_write_op<etcdserverpb::WatchRequest>*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ("/master", op->request.create_request().key());
    bop->complete(true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lw::detail::stream_read_op<etcdserverpb::WatchResponse>*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_watch_id(3);
    bop->complete(true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lw::detail::stream_finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::CANCELLED, "cancelled");
    bop->complete(true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).Times(1);

  int writes = 0;
  etcdserverpb::WatchRequest req;
  req.mutable_create_request()->set_key("/master");
  queue.async_write(stream, std::move(req), "test/Watch::Write", [&writes](auto const&, bool ok) { writes += ok; });
  EXPECT_EQ(1, writes);

  std::int64_t watch_id = 0;
  queue.async_read(stream, "test/Watch::Read", [&watch_id](auto const& op, bool ok) {
    watch_id = op.response.watch_id();
  });
  EXPECT_EQ(3, watch_id);

  grpc::StatusCode code = grpc::OK;
  queue.async_finish(stream, "test/Watch::Finish", [&code](auto const& op, bool) { code = op.status.error_code(); });
  EXPECT_EQ(grpc::CANCELLED, code);

  queue.try_cancel(stream);
}
