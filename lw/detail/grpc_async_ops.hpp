#ifndef lw_detail_grpc_async_ops_hpp
#define lw_detail_grpc_async_ops_hpp
/**
 * @file
 *
 * The operation types posted by lw::completion_queue.
 *
 * leadwatch makes two kinds of calls to etcd: unary RPCs (KV::Range) and a bi-directional stream (Watch::Watch).  Each
 * call, and each Write(), Read() and Finish() on the stream, is represented by one of the types below.  The type
 * traits extract the request and response types from the signature of the generated stub member functions.
 */

#include <lw/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <memory>
#include <type_traits>

namespace lw {
namespace detail {

//@{
/// @name signature traits for unary RPCs, e.g. KV::Stub::AsyncRange

template <typename M>
struct unary_rpc_signature {
  using matches = std::false_type;
};

template <typename W, typename R>
struct unary_rpc_signature<std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(
    grpc::ClientContext*, W const&, grpc::CompletionQueue*)> {
  using matches = std::true_type;
  using request_type = W;
  using response_type = R;
};
//@}

/**
 * A unary RPC in flight.
 *
 * The request is moved into the operation before the call starts, the response and status are valid once the
 * callback receives ok == true.
 */
template <typename W, typename R>
struct unary_rpc_op : public base_async_op {
  grpc::ClientContext context;
  W request;
  R response;
  grpc::Status status;
  std::unique_ptr<grpc::ClientAsyncResponseReader<R>> rpc;
};

/**
 * A bi-directional stream, such as the etcd Watch stream.
 *
 * Unlike the operations it is shared by the caller and the completion queue: it must outlive all the reads and writes
 * posted on it.  Cancelling the context (see lw::completion_queue::try_cancel) completes them with ok == false.
 */
template <typename W, typename R>
struct rdwr_stream {
  using write_type = W;
  using read_type = R;

  grpc::ClientContext context;
  std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>> client;
};

//@{
/// @name signature traits for streaming RPCs, e.g. Watch::Stub::AsyncWatch

template <typename M>
struct rdwr_stream_signature {
  using matches = std::false_type;
};

template <typename W, typename R>
struct rdwr_stream_signature<std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>(
    grpc::ClientContext*, grpc::CompletionQueue*, void*)> {
  using matches = std::true_type;
  using write_type = W;
  using read_type = R;
  using stream_type = rdwr_stream<W, R>;
};
//@}

/// Open a new stream, the stream is ready for reads and writes when the callback receives ok == true.
template <typename W, typename R>
struct create_stream_op : public base_async_op {
  std::shared_ptr<rdwr_stream<W, R>> stream = std::make_shared<rdwr_stream<W, R>>();
};

/// A Write() on a stream, for the watcher this is always a WatchCreateRequest.
template <typename W>
struct stream_write_op : public base_async_op {
  W request;
};

/// A Read() on a stream, ok == false means the stream is closed and Finish() should be called.
template <typename R>
struct stream_read_op : public base_async_op {
  R response;
};

/// A Finish() on a stream, the status explains why the stream closed.
struct stream_finish_op : public base_async_op {
  grpc::Status status;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_grpc_async_ops_hpp
