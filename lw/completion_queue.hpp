#ifndef lw_completion_queue_hpp
#define lw_completion_queue_hpp

#include <lw/detail/base_async_op.hpp>
#include <lw/detail/base_completion_queue.hpp>
#include <lw/detail/deadline_timer.hpp>
#include <lw/detail/default_grpc_interceptor.hpp>
#include <lw/detail/grpc_async_ops.hpp>
#include <lw/detail/grpc_errors.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace lw {

/// Tag type, the overloads that receive it return a std::shared_future instead of calling a functor.
struct use_future {};

/**
 * Post asynchronous etcd calls and call a functor when each one completes.
 *
 * The node watchers are written as chains of callbacks: Range, then open the Watch stream, then write the create
 * request, then read events until the stream breaks.  Each step posts the next one from the callback of the previous
 * one.  The callbacks run in the thread calling run(), see lw::active_completion_queue.
 *
 * The functors receive the completed operation (or the stream) and a flag, false if the operation was cancelled or the
 * stream closed.  The operation is released after the functor returns.
 *
 * @tparam grpc_interceptor_t the object making the actual gRPC calls, lw::detail::mocked_grpc_interceptor in the unit
 * tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  using grpc_interceptor_type = grpc_interceptor_t;

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

  /**
   * Call @a f at @a deadline, or earlier with ok == false if the returned timer is cancelled.
   *
   * The timers pace reconnection attempts, system_clock adjustments only make a delay a bit shorter or longer.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer>
  make_deadline_timer(std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    op->deadline = deadline;
    void* tag = register_op("make_deadline_timer()", op);
    interceptor_.make_deadline_timer(op, cq(), tag);
    return op;
  }

  /// Call @a f after @a duration.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(duration_type duration, std::string name, Functor&& f) {
    return make_deadline_timer(std::chrono::system_clock::now() + duration, std::move(name), std::forward<Functor>(f));
  }

  /**
   * Start a unary RPC, @a f receives the completed lw::detail::unary_rpc_op.
   *
   * @code
   * etcdserverpb::RangeRequest req;
   * req.set_key("/hbase/master");
   * queue.async_rpc(kv.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "range",
   *     [](auto const& op, bool ok) {
   *       // ... op.status and op.response are valid if ok is true ...
   *     });
   * @endcode
   */
  template <typename C, typename M, typename W, typename Functor>
  void async_rpc(C* stub, M C::*call, W&& request, std::string name, Functor&& f) {
    using signature = detail::unary_rpc_signature<M>;
    static_assert(
        signature::matches::value,
        "expected a member function with signature "
        "std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(grpc::ClientContext*,W const&,grpc::CompletionQueue*)");
    using request_type = typename signature::request_type;
    using response_type = typename signature::response_type;
    static_assert(
        std::is_same<typename std::decay<W>::type, request_type>::value,
        "the request type does not match the member function signature");

    auto op = create_op<detail::unary_rpc_op<request_type, response_type>>(std::move(name), std::forward<Functor>(f));
    op->request.Swap(&request);
    void* tag = register_op("async_rpc()", op);
    interceptor_.async_rpc(stub, call, op, cq(), tag);
  }

  /**
   * Start a unary RPC and return a future for its response.
   *
   * The future holds lw::etcd_error if the RPC fails, and std::runtime_error if it is cancelled.
   */
  template <typename C, typename M, typename W>
  std::shared_future<typename detail::unary_rpc_signature<M>::response_type>
  async_rpc(C* stub, M C::*call, W&& request, std::string name, use_future) {
    using response_type = typename detail::unary_rpc_signature<M>::response_type;
    auto promise = std::make_shared<std::promise<response_type>>();
    auto where = "async_rpc(" + name + ")";
    async_rpc(stub, call, std::forward<W>(request), std::move(name), [promise, where](auto const& op, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error(where + " cancelled")));
        return;
      }
      try {
        detail::check_grpc_status(op.status, where);
        promise->set_value(op.response);
      } catch (std::exception const&) {
        promise->set_exception(std::current_exception());
      }
    });
    return promise->get_future().share();
  }

  /**
   * Open a bi-directional stream, @a f receives a std::shared_ptr<lw::detail::rdwr_stream<W, R>>.
   *
   * @code
   * queue.async_create_rdwr_stream(watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "watch",
   *     [](auto stream, bool ok) {
   *       // ... the stream is ready for reads and writes if ok is true ...
   *     });
   * @endcode
   */
  template <typename C, typename M, typename Functor>
  void async_create_rdwr_stream(C* stub, M C::*call, std::string name, Functor&& f) {
    using signature = detail::rdwr_stream_signature<M>;
    static_assert(
        signature::matches::value,
        "expected a member function with signature "
        "std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>(grpc::ClientContext*,grpc::CompletionQueue*,void*)");
    using op_type = detail::create_stream_op<typename signature::write_type, typename signature::read_type>;

    auto op = create_op<op_type>(
        std::move(name), [functor = std::forward<Functor>(f)](op_type const& op, bool ok) { functor(op.stream, ok); });
    void* tag = register_op("async_create_rdwr_stream()", op);
    interceptor_.async_create_rdwr_stream(stub, call, op, cq(), tag);
  }

  /// Open a bi-directional stream and return a future for it.
  template <typename C, typename M>
  std::shared_future<std::shared_ptr<typename detail::rdwr_stream_signature<M>::stream_type>>
  async_create_rdwr_stream(C* stub, M C::*call, std::string name, use_future) {
    using stream_type = typename detail::rdwr_stream_signature<M>::stream_type;
    auto promise = std::make_shared<std::promise<std::shared_ptr<stream_type>>>();
    auto where = "async_create_rdwr_stream(" + name + ")";
    async_create_rdwr_stream(stub, call, std::move(name), [promise, where](auto stream, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error(where + " failed")));
        return;
      }
      promise->set_value(std::move(stream));
    });
    return promise->get_future().share();
  }

  /// Write @a request to @a stream, @a f receives the lw::detail::stream_write_op.
  template <typename W, typename R, typename Functor>
  void async_write(detail::rdwr_stream<W, R>& stream, W&& request, std::string name, Functor&& f) {
    auto op = create_op<detail::stream_write_op<W>>(std::move(name), std::forward<Functor>(f));
    op->request.Swap(&request);
    void* tag = register_op("async_write()", op);
    interceptor_.async_write(stream, op, tag);
  }

  /// Read the next message from @a stream, @a f receives the lw::detail::stream_read_op.
  template <typename W, typename R, typename Functor>
  void async_read(detail::rdwr_stream<W, R> const& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::stream_read_op<R>>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_read()", op);
    interceptor_.async_read(stream, op, tag);
  }

  /// Collect the final status of @a stream, call it once a read or write fails.
  template <typename W, typename R, typename Functor>
  void async_finish(detail::rdwr_stream<W, R> const& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::stream_finish_op>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_finish()", op);
    interceptor_.async_finish(stream, op, tag);
  }

  /// Cancel @a stream, its pending operations complete with ok == false.
  template <typename W, typename R>
  void try_cancel(detail::rdwr_stream<W, R>& stream) {
    interceptor_.try_cancel(stream);
  }

private:
  /// Create an operation of type @a op_type whose callback downcasts and calls @a f.
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->name = std::move(name);
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op& bop, bool ok) {
      functor(dynamic_cast<op_type const&>(bop), ok);
    };
    return op;
  }

  grpc_interceptor_type interceptor_;
};

} // namespace lw

#endif // lw_completion_queue_hpp
