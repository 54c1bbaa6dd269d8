#ifndef lw_node_watcher_hpp
#define lw_node_watcher_hpp

#include <string>

namespace lw {

/**
 * Define the interface for the classes that keep a lw::watched_value in sync with the coordination service.
 */
class node_watcher {
public:
  /// Destructor, can raise if releasing the gRPC resources fails.
  virtual ~node_watcher() noexcept(false) = 0;

  /**
   * Read the current value of the node and start watching it.
   *
   * Blocks until the initial read completes, so the watched value reflects the coordination service when this
   * function returns.
   *
   * @throws lw::etcd_error if the initial read fails, std::runtime_error if it is cancelled.
   */
  virtual void startup() = 0;

  /// Stop watching, wait for the pending operations, and release any threads waiting on the value.
  virtual void shutdown() = 0;

  /// The path of the node being watched.
  virtual std::string const& path() const = 0;
};

} // namespace lw

#endif // lw_node_watcher_hpp
