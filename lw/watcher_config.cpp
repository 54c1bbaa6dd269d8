#include "lw/watcher_config.hpp"
#include <lw/detail/reconnect_policies.hpp>

#include <ostream>
#include <sstream>
#include <stdexcept>

namespace lw {

void watcher_config::validate() const {
  std::ostringstream os;
  if (etcd_address.empty()) {
    os << "watcher_config::validate() - empty etcd_address";
  } else if (reconnect_min_delay <= std::chrono::milliseconds(0)) {
    os << "watcher_config::validate() - reconnect_min_delay (" << reconnect_min_delay.count() << "ms) should be > 0";
  } else if (reconnect_min_delay > reconnect_max_delay) {
    os << "watcher_config::validate() - reconnect_min_delay (" << reconnect_min_delay.count()
       << "ms) should be <= reconnect_max_delay (" << reconnect_max_delay.count() << "ms)";
  } else if (reconnect_max_attempts <= 0) {
    os << "watcher_config::validate() - reconnect_max_attempts (" << reconnect_max_attempts << ") should be > 0";
  } else {
    return;
  }
  throw std::invalid_argument(os.str());
}

std::unique_ptr<detail::backoff_policy> watcher_config::backoff_policy() const {
  return std::unique_ptr<detail::backoff_policy>(
      new detail::exponential_backoff(reconnect_min_delay, reconnect_max_delay));
}

std::unique_ptr<detail::retry_policy> watcher_config::retry_policy() const {
  return std::unique_ptr<detail::retry_policy>(new detail::limited_attempts(reconnect_max_attempts));
}

std::ostream& operator<<(std::ostream& os, watcher_config const& x) {
  return os << "etcd_address=" << x.etcd_address << ", reconnect_min_delay=" << x.reconnect_min_delay.count()
            << "ms, reconnect_max_delay=" << x.reconnect_max_delay.count()
            << "ms, reconnect_max_attempts=" << x.reconnect_max_attempts;
}

} // namespace lw
