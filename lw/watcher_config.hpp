#ifndef lw_watcher_config_hpp
#define lw_watcher_config_hpp

#include <lw/detail/reconnect_policies.hpp>

#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

namespace lw {

/**
 * Configure the connection of a node watcher to etcd.
 *
 * The defaults are suitable for a local etcd server.  Applications typically parse these values from the command
 * line, see examples/watch_master.cpp.
 */
struct watcher_config {
  watcher_config()
      : etcd_address("localhost:2379")
      , reconnect_min_delay(100)
      , reconnect_max_delay(5000)
      , reconnect_max_attempts(20) {
  }

  /// The etcd server, in the format expected by grpc::CreateChannel().
  std::string etcd_address;

  //@{
  /// @name Pace the reconnection attempts with an exponential backoff between these values.
  std::chrono::milliseconds reconnect_min_delay;
  std::chrono::milliseconds reconnect_max_delay;
  //@}

  /// Give up, and call the abort handler, after this many consecutive failures.
  int reconnect_max_attempts;

  /// Raise std::invalid_argument if the configuration is not usable.
  void validate() const;

  /// Create the backoff policy described by this configuration.
  std::unique_ptr<detail::backoff_policy> backoff_policy() const;

  /// Create the retry policy described by this configuration.
  std::unique_ptr<detail::retry_policy> retry_policy() const;
};

/// Streaming operator, mostly for logging.
std::ostream& operator<<(std::ostream& os, watcher_config const& x);

} // namespace lw

#endif // lw_watcher_config_hpp
