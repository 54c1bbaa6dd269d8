#include "lw/etcd_node_watcher.hpp"
#include <lw/detail/node_watcher_impl.hpp>

namespace lw {

namespace {
watcher_config const& validated(watcher_config const& config) {
  config.validate();
  return config;
}
} // anonymous namespace

etcd_node_watcher::etcd_node_watcher(
    std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> etcd_channel, watched_value& node,
    std::shared_ptr<abortable> abort_handler, watcher_config const& config)
    : queue_(std::move(queue))
    , channel_(std::move(etcd_channel))
    , watcher_(new detail::node_watcher_impl<completion_queue<>>(
          queue_->cq(), etcdserverpb::KV::NewStub(channel_), etcdserverpb::Watch::NewStub(channel_), node,
          std::move(abort_handler), *validated(config).backoff_policy(), *config.retry_policy())) {
}

} // namespace lw
