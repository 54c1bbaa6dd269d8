#ifndef lw_etcd_node_watcher_hpp
#define lw_etcd_node_watcher_hpp

#include <lw/abortable.hpp>
#include <lw/active_completion_queue.hpp>
#include <lw/node_watcher.hpp>
#include <lw/watched_value.hpp>
#include <lw/watcher_config.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace lw {

/**
 * Keep a lw::watched_value in sync with an etcd key.
 *
 * @code
 * auto queue = std::make_shared<lw::active_completion_queue>();
 * auto channel = grpc::CreateChannel("localhost:2379", grpc::InsecureChannelCredentials());
 * lw::watched_value node("/hbase/master", lw::master_address_tracker::log_identity());
 * lw::etcd_node_watcher watcher(queue, channel, node, lw::make_abortable([](std::string const& why) { ... }));
 * watcher.startup();
 * lw::master_address_tracker tracker(node);
 * auto master = tracker.wait_for_master(std::chrono::seconds(10));
 * @endcode
 */
class etcd_node_watcher : public node_watcher {
public:
  etcd_node_watcher(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> etcd_channel, watched_value& node,
      std::shared_ptr<abortable> abort_handler, watcher_config const& config = watcher_config());

  ~etcd_node_watcher() noexcept(false) = default;

  //@{
  /// @name Implement the node_watcher interface using the pimpl idiom.
  void startup() override {
    watcher_->startup();
  }
  void shutdown() override {
    watcher_->shutdown();
  }
  std::string const& path() const override {
    return watcher_->path();
  }
  //@}

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<node_watcher> watcher_;
};

} // namespace lw

#endif // lw_etcd_node_watcher_hpp
