#ifndef lw_detail_mocked_grpc_interceptor_hpp
#define lw_detail_mocked_grpc_interceptor_hpp

#include <lw/detail/base_async_op.hpp>
#include <lw/detail/deadline_timer.hpp>
#include <lw/detail/grpc_async_ops.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace lw {
namespace detail {

/**
 * A grpc_interceptor_t for lw::completion_queue that plays the role of the etcd server in the unit tests.
 *
 * Every call is forwarded, with the operation type erased, to @c shared_mock.  Nothing is posted to the
 * grpc::CompletionQueue, so the tests must complete the operations themselves: either inside the mock action (the
 * RPC returns immediately) or later, to simulate a Watch stream that blocks until the next event.  The stubs are never
 * used, null pointers are fine.
 *
 * @code
 * using namespace ::testing;
 * lw::completion_queue<lw::detail::mocked_grpc_interceptor> queue;
 * EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([](auto bop) {
 *   // ... downcast bop, fill the response ...
 *   bop->complete(true);
 * }));
 * @endcode
 */
struct mocked_grpc_interceptor {
  struct mock_type {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD1(async_rpc, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD1(async_create_rdwr_stream, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD1(async_write, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD1(async_read, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD1(async_finish, void(std::shared_ptr<base_async_op>));
    MOCK_CONST_METHOD0(try_cancel, void());
  };

  /// Shared so copies of the interceptor (the completion queue takes it by value) report to the same mock.
  std::shared_ptr<mock_type> shared_mock = std::make_shared<mock_type>();

  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->make_deadline_timer(std::move(op));
  }

  template <typename C, typename M, typename op_type>
  void async_rpc(C*, M C::*, std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->async_rpc(std::move(op));
  }

  template <typename C, typename M, typename op_type>
  void async_create_rdwr_stream(C*, M C::*, std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->async_create_rdwr_stream(std::move(op));
  }

  template <typename W, typename R, typename op_type>
  void async_write(rdwr_stream<W, R> const&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_write(std::move(op));
  }

  template <typename W, typename R, typename op_type>
  void async_read(rdwr_stream<W, R> const&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_read(std::move(op));
  }

  template <typename W, typename R, typename op_type>
  void async_finish(rdwr_stream<W, R> const&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_finish(std::move(op));
  }

  /// The real interceptor cancels the stream context, the tests decide which pending operations fail.
  template <typename W, typename R>
  void try_cancel(rdwr_stream<W, R>&) {
    shared_mock->try_cancel();
  }
};

} // namespace detail
} // namespace lw

#endif // lw_detail_mocked_grpc_interceptor_hpp
