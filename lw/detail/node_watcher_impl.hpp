#ifndef lw_detail_node_watcher_impl_hpp
#define lw_detail_node_watcher_impl_hpp

#include <lw/abortable.hpp>
#include <lw/assert_throw.hpp>
#include <lw/completion_queue.hpp>
#include <lw/detail/async_op_counter.hpp>
#include <lw/detail/grpc_async_ops.hpp>
#include <lw/detail/grpc_errors.hpp>
#include <lw/detail/reconnect_policies.hpp>
#include <lw/log.hpp>
#include <lw/node_watcher.hpp>
#include <lw/watched_value.hpp>

#include <etcdserverpb/rpc.grpc.pb.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace lw {
namespace detail {

/**
 * Keep a lw::watched_value in sync with an etcd key.
 *
 * The watcher reads the key with a Range RPC, and then creates a watch starting at the revision right after the
 * Range, so no change is lost between the two.  PUT events update the value, DELETE events clear it.  If etcd cancels
 * the watch, for example because the revision was compacted, the watcher reads the key again and creates a new watch.
 * If the stream breaks it reconnects after a delay chosen by the backoff policy, and gives up (calling the abort
 * handler) once the retry policy is exhausted.
 *
 * All the callbacks run in the thread of the completion queue.  None of the locks in this class are held while
 * posting asynchronous operations, the mocked completion queues in the tests complete them immediately.
 *
 * @tparam completion_queue_type the type of completion queue, lw::completion_queue<> or a mocked version.
 */
template <typename completion_queue_type>
class node_watcher_impl : public node_watcher {
public:
  //@{
  /// @name type traits
  using watch_stream_type = rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;
  using watch_write_op = stream_write_op<etcdserverpb::WatchRequest>;
  using watch_read_op = stream_read_op<etcdserverpb::WatchResponse>;
  using range_op = unary_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
  //@}

  /**
   * Create a watcher for @a node.
   *
   * @param queue the completion queue to mediate all gRPC operations.
   * @param kv_stub a stub to access the etcd KV service.
   * @param watch_stub a stub to access the etcd Watch service.
   * @param node the value kept in sync, the etcd key is node.path().  It must outlive the watcher.
   * @param abort_handler called if the watcher gives up reconnecting.
   * @param backoff pace the reconnection attempts, the watcher keeps a copy.
   * @param retry decide when to give up reconnecting, the watcher keeps a copy.
   */
  node_watcher_impl(
      completion_queue_type& queue, std::unique_ptr<etcdserverpb::KV::Stub> kv_stub,
      std::unique_ptr<etcdserverpb::Watch::Stub> watch_stub, watched_value& node,
      std::shared_ptr<abortable> abort_handler, backoff_policy const& backoff, retry_policy const& retry)
      : queue_(queue)
      , kv_stub_(std::move(kv_stub))
      , watch_stub_(std::move(watch_stub))
      , node_(node)
      , abort_handler_(std::move(abort_handler))
      , backoff_prototype_(backoff.clone())
      , retry_prototype_(retry.clone())
      , backoff_(backoff.clone())
      , retry_(retry.clone())
      , mu_()
      , watcher_stream_()
      , reconnect_timer_()
      , revision_(0)
      , ops_() {
    LW_ASSERT_THROW_MSG((bool)abort_handler_, "node_watcher_impl requires an abort handler");
  }

  virtual ~node_watcher_impl() noexcept(false) {
    cleanup();
  }

  //@{
  /// @name implement the lw::node_watcher interface
  void startup() override {
    // ... the initial read is blocking, the caller expects the value to be current when this function returns ...
    auto response = queue_
                        .async_rpc(
                            kv_stub_.get(), &etcdserverpb::KV::Stub::AsyncRange, range_request(),
                            op_name("startup/range"), lw::use_future())
                        .get();
    apply_range(response);

    auto stream = queue_
                      .async_create_rdwr_stream(
                          watch_stub_.get(), &etcdserverpb::Watch::Stub::AsyncWatch,
                          op_name("startup/create_stream"), lw::use_future())
                      .get();
    {
      std::lock_guard<std::mutex> lock(mu_);
      watcher_stream_ = std::move(stream);
    }
    create_watch();
  }

  void shutdown() override {
    cleanup();
  }

  std::string const& path() const override {
    return node_.path();
  }
  //@}

  /// The etcd revision of the last change observed.
  std::int64_t revision() const {
    std::lock_guard<std::mutex> lock(mu_);
    return revision_;
  }

private:
  /// Cancel the pending operations, wait for them, and release the threads blocked on the value.
  void cleanup() {
    // ... stop any new operations from being posted ...
    ops_.shutdown();
    std::shared_ptr<watch_stream_type> stream;
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stream = watcher_stream_;
      timer = reconnect_timer_;
    }
    if (stream) {
      queue_.try_cancel(*stream);
    }
    if (timer) {
      timer->cancel();
    }
    ops_.block_until_all_done();
    node_.stop();
  }

  std::string op_name(char const* what) const {
    return "node_watcher(" + node_.path() + ")/" + what;
  }

  etcdserverpb::RangeRequest range_request() const {
    etcdserverpb::RangeRequest req;
    req.set_key(node_.path());
    return req;
  }

  std::shared_ptr<watch_stream_type> current_stream() const {
    std::lock_guard<std::mutex> lock(mu_);
    return watcher_stream_;
  }

  /// Publish the result of a Range request and remember its revision.
  void apply_range(etcdserverpb::RangeResponse const& response) {
    if (response.kvs().empty()) {
      LW_LOG_AS(info, node_.log_identity()) << node_.path() << " does not exist at revision "
                                            << response.header().revision();
      node_.clear();
    } else {
      LW_LOG_AS(info, node_.log_identity()) << node_.path() << " = " << response.kvs(0).value() << " at revision "
                                            << response.header().revision();
      node_.update(response.kvs(0).value());
    }
    std::lock_guard<std::mutex> lock(mu_);
    revision_ = response.header().revision();
  }

  void create_watch() {
    auto stream = current_stream();
    LW_ASSERT_THROW(stream.get() != nullptr);
    etcdserverpb::WatchRequest req;
    auto& create = *req.mutable_create_request();
    create.set_key(node_.path());
    create.set_start_revision(revision() + 1);

    if (not ops_.async_op_start(op_name("create_watch"), " start_revision=", create.start_revision())) {
      return;
    }
    queue_.async_write(*stream, std::move(req), op_name("create_watch"), [this](auto const& op, bool ok) {
      this->on_watch_create(op, ok);
    });
  }

  void on_watch_create(watch_write_op const&, bool ok) {
    ops_.async_op_done(op_name("create_watch"));
    if (not ok) {
      stream_failed("create_watch", false);
      return;
    }
    read_next();
  }

  void read_next() {
    auto stream = current_stream();
    if (not ops_.async_op_start(op_name("read"))) {
      return;
    }
    queue_.async_read(*stream, op_name("read"), [this](auto const& op, bool ok) { this->on_watch_read(op, ok); });
  }

  void on_watch_read(watch_read_op const& op, bool ok) {
    ops_.async_op_done(op_name("read"));
    if (not ok) {
      stream_failed("read", false);
      return;
    }
    auto const& response = op.response;
    if (response.canceled() or response.compact_revision() != 0) {
      LW_LOG_AS(warning, node_.log_identity())
          << "watch on " << node_.path() << " cancelled, compact_revision=" << response.compact_revision()
          << ", reason=" << response.cancel_reason() << ", re-synchronizing";
      resync();
      return;
    }
    if (response.created()) {
      LW_LOG_AS(debug, node_.log_identity()) << "watch on " << node_.path() << " created, id=" << response.watch_id();
      // ... the stream is healthy again, count the failures from scratch ...
      backoff_ = backoff_prototype_->clone();
      retry_ = retry_prototype_->clone();
    }
    for (auto const& ev : response.events()) {
      auto const& kv = ev.kv();
      if (ev.type() == mvccpb::Event::PUT) {
        LW_LOG_AS(info, node_.log_identity()) << "PUT on " << kv.key() << " = " << kv.value() << " / "
                                              << kv.mod_revision();
        node_.update(kv.value());
      } else if (ev.type() == mvccpb::Event::DELETE) {
        LW_LOG_AS(info, node_.log_identity()) << "DEL on " << kv.key() << " / " << kv.mod_revision();
        node_.clear();
      }
      std::lock_guard<std::mutex> lock(mu_);
      revision_ = std::max(revision_, kv.mod_revision());
    }
    read_next();
  }

  /// Read the key again and create a new watch on the same stream.
  void resync() {
    if (not ops_.async_op_start(op_name("resync/range"))) {
      return;
    }
    queue_.async_rpc(
        kv_stub_.get(), &etcdserverpb::KV::Stub::AsyncRange, range_request(), op_name("resync/range"),
        [this](auto const& op, bool ok) { this->on_resync_range(op, ok); });
  }

  void on_resync_range(range_op const& op, bool ok) {
    ops_.async_op_done(op_name("resync/range"));
    if (not ok or not op.status.ok()) {
      LW_LOG_AS(warning, node_.log_identity())
          << "re-synchronizing " << node_.path() << " failed, ok=" << ok << ", " << format_grpc_error(op.status);
      // ... the stream is still open, cancel it so Finish() completes ...
      stream_failed("resync/range", true);
      return;
    }
    apply_range(op.response);
    create_watch();
  }

  /**
   * Collect the status of a broken stream and schedule a reconnection.
   *
   * @param where the operation that detected the failure.
   * @param cancel if true the stream is still open and must be cancelled first.
   */
  void stream_failed(char const* where, bool cancel) {
    auto stream = current_stream();
    if (not ops_.async_op_start(op_name("finish"), " after failure in ", where)) {
      return;
    }
    if (cancel) {
      queue_.try_cancel(*stream);
    }
    queue_.async_finish(*stream, op_name("finish"), [this, where](auto const& op, bool) {
      this->on_finish(op, where);
    });
  }

  void on_finish(stream_finish_op const& op, char const* where) {
    ops_.async_op_done(op_name("finish"));
    LW_LOG_AS(warning, node_.log_identity())
        << "watch stream for " << node_.path() << " failed in " << where << ", " << format_grpc_error(op.status);
    schedule_reconnect();
  }

  void schedule_reconnect() {
    if (ops_.in_shutdown()) {
      return;
    }
    if (not retry_->on_failure()) {
      std::ostringstream os;
      os << "node_watcher(" << node_.path() << ") - giving up after repeated failures to reach etcd, " << *retry_;
      LW_LOG_AS(critical, node_.log_identity()) << os.str();
      // ... nobody updates the value anymore, do not leave threads blocked on it ...
      node_.stop();
      abort_handler_->abort(os.str());
      return;
    }
    auto delay = backoff_->on_failure();
    LW_LOG_AS(info, node_.log_identity()) << "reconnecting watch for " << node_.path() << " in " << delay.count()
                                          << "ms, " << *backoff_;
    if (not ops_.async_op_start(op_name("reconnect/timer"))) {
      return;
    }
    auto timer = queue_.make_relative_timer(
        delay, op_name("reconnect/timer"), [this](auto const&, bool ok) { this->on_reconnect_timer(ok); });
    {
      std::lock_guard<std::mutex> lock(mu_);
      reconnect_timer_ = timer;
    }
    // ... cleanup() may have missed the new timer ...
    if (ops_.in_shutdown()) {
      timer->cancel();
    }
  }

  void on_reconnect_timer(bool ok) {
    ops_.async_op_done(op_name("reconnect/timer"));
    if (not ok) {
      // ... the timer is only cancelled during shutdown ...
      return;
    }
    if (not ops_.async_op_start(op_name("reconnect/range"))) {
      return;
    }
    queue_.async_rpc(
        kv_stub_.get(), &etcdserverpb::KV::Stub::AsyncRange, range_request(), op_name("reconnect/range"),
        [this](auto const& op, bool ok) { this->on_reconnect_range(op, ok); });
  }

  void on_reconnect_range(range_op const& op, bool ok) {
    ops_.async_op_done(op_name("reconnect/range"));
    if (not ok or not op.status.ok()) {
      LW_LOG_AS(warning, node_.log_identity())
          << "reconnecting to " << node_.path() << " failed, ok=" << ok << ", " << format_grpc_error(op.status);
      schedule_reconnect();
      return;
    }
    apply_range(op.response);
    if (not ops_.async_op_start(op_name("reconnect/create_stream"))) {
      return;
    }
    queue_.async_create_rdwr_stream(
        watch_stub_.get(), &etcdserverpb::Watch::Stub::AsyncWatch, op_name("reconnect/create_stream"),
        [this](auto stream, bool ok) { this->on_reconnect_stream(std::move(stream), ok); });
  }

  void on_reconnect_stream(std::shared_ptr<watch_stream_type> stream, bool ok) {
    ops_.async_op_done(op_name("reconnect/create_stream"));
    if (not ok) {
      LW_LOG_AS(warning, node_.log_identity()) << "cannot create watch stream for " << node_.path();
      schedule_reconnect();
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      watcher_stream_ = std::move(stream);
    }
    create_watch();
  }

private:
  completion_queue_type& queue_;
  std::unique_ptr<etcdserverpb::KV::Stub> kv_stub_;
  std::unique_ptr<etcdserverpb::Watch::Stub> watch_stub_;
  watched_value& node_;
  std::shared_ptr<abortable> abort_handler_;

  // Only used in the completion queue thread.
  std::unique_ptr<backoff_policy> backoff_prototype_;
  std::unique_ptr<retry_policy> retry_prototype_;
  std::unique_ptr<backoff_policy> backoff_;
  std::unique_ptr<retry_policy> retry_;

  mutable std::mutex mu_;
  std::shared_ptr<watch_stream_type> watcher_stream_;
  std::shared_ptr<deadline_timer> reconnect_timer_;
  std::int64_t revision_;

  async_op_counter ops_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_node_watcher_impl_hpp
