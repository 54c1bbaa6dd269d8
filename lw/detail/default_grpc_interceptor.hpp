#ifndef lw_detail_default_grpc_interceptor_hpp
#define lw_detail_default_grpc_interceptor_hpp

#include <lw/detail/deadline_timer.hpp>
#include <lw/detail/grpc_async_ops.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace lw {
namespace detail {

/**
 * The grpc_interceptor_t used in production: each member function makes the gRPC call it is named after.
 *
 * lw::completion_queue routes every gRPC call through its interceptor, so the unit tests can replace this type with
 * lw::detail::mocked_grpc_interceptor and run the node watchers without an etcd server.  Keep the two in sync.
 */
struct default_grpc_interceptor {
  void make_deadline_timer(std::shared_ptr<deadline_timer> op, grpc::CompletionQueue* cq, void* tag) {
    op->arm(cq, tag);
  }

  /// Start a unary RPC, gRPC fills the response and status before it returns @a tag.
  template <typename C, typename M, typename op_type>
  void async_rpc(C* stub, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = (stub->*call)(&op->context, op->request, cq);
    op->rpc->Finish(&op->response, &op->status, tag);
  }

  /// Open a stream, @a tag is returned once the stream is ready.
  template <typename C, typename M, typename op_type>
  void async_create_rdwr_stream(C* stub, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->stream->client = (stub->*call)(&op->stream->context, cq, tag);
  }

  //@{
  /// @name stream operations, at most one read and one write may be pending on a stream at any time

  template <typename W, typename R, typename op_type>
  void async_write(rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Write(op->request, tag);
  }

  template <typename W, typename R, typename op_type>
  void async_read(rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Read(&op->response, tag);
  }

  template <typename W, typename R, typename op_type>
  void async_finish(rdwr_stream<W, R> const& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Finish(&op->status, tag);
  }

  /// Cancel the stream, its pending operations complete with ok == false.
  template <typename W, typename R>
  void try_cancel(rdwr_stream<W, R>& stream) {
    stream.context.TryCancel();
  }
  //@}
};

} // namespace detail
} // namespace lw

#endif // lw_detail_default_grpc_interceptor_hpp
