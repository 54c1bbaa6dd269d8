#ifndef lw_detail_async_op_counter_hpp
#define lw_detail_async_op_counter_hpp

#include <lw/detail/append_annotations.hpp>
#include <lw/log.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lw {
namespace detail {

/**
 * Track the asynchronous operations a node watcher has in flight.
 *
 * Every callback posted by the watcher references the watcher itself, so the watcher must not be destroyed while any
 * of them is pending.  The watcher calls async_op_start() before posting each operation and async_op_done() as the
 * first thing in its callback.  On shutdown it calls block_until_all_done(), after that no new operation starts.
 *
 * The operations are tracked by name, so a shutdown that hangs reports what it is waiting for.
 */
class async_op_counter {
public:
  /// How often block_until_all_done() logs the operations it is still waiting for.
  static std::chrono::milliseconds constexpr report_interval{1000};

  async_op_counter()
      : mu_()
      , cv_()
      , pending_()
      , shutdown_(false) {
  }

  /**
   * Count a new operation, call it before the operation is posted.
   *
   * @param name the operation name, async_op_done() must receive the same name.
   * @param a additional information for the trace log.
   * @return false if shutdown() was called, the operation must not be posted.
   */
  template <typename... Annotations>
  bool async_op_start(std::string const& name, Annotations&&... a) {
    trace("async_op_start(", name, ") pending=", pending(), std::forward<Annotations>(a)...);
    return add_op(name);
  }

  /// Count a completed, failed or cancelled operation.
  template <typename... Annotations>
  void async_op_done(std::string const& name, Annotations&&... a) {
    trace("async_op_done(", name, ") pending=", pending(), std::forward<Annotations>(a)...);
    del_op(name);
  }

  /// Reject new operations.
  void shutdown() {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }

  bool in_shutdown() const {
    std::lock_guard<std::mutex> lock(mu_);
    return shutdown_;
  }

  /**
   * Reject new operations and wait for the pending ones.
   *
   * Never call it from the completion queue thread, that is the thread completing the operations.
   */
  void block_until_all_done();

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
  }

  /// The names of the pending operations, sorted.
  std::vector<std::string> pending_names() const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::vector<std::string>(pending_.begin(), pending_.end());
  }

private:
  template <typename... Annotations>
  void trace(Annotations&&... a) const {
    LW_LOGGER_DECL(trace, lw::log::instance(), line);
    if (line) {
      append_annotations(line.get(), std::forward<Annotations>(a)...);
      line.write_to(lw::log::instance());
    }
  }

  bool add_op(std::string const& name);
  void del_op(std::string const& name);

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::multiset<std::string> pending_;
  bool shutdown_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_async_op_counter_hpp
