#include "lw/detail/async_op_counter.hpp"

#include <sstream>

namespace lw {
namespace detail {

std::chrono::milliseconds constexpr async_op_counter::report_interval;

void async_op_counter::block_until_all_done() {
  std::unique_lock<std::mutex> lock(mu_);
  shutdown_ = true;
  while (not cv_.wait_for(lock, report_interval, [this]() { return pending_.empty(); })) {
    std::ostringstream os;
    for (auto const& name : pending_) {
      os << " " << name;
    }
    LW_LOG(warning) << "still waiting for " << pending_.size() << " operations:" << os.str();
  }
}

bool async_op_counter::add_op(std::string const& name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_) {
    return false;
  }
  pending_.insert(name);
  return true;
}

void async_op_counter::del_op(std::string const& name) {
  std::unique_lock<std::mutex> lock(mu_);
  auto i = pending_.find(name);
  if (i == pending_.end()) {
    lock.unlock();
    LW_LOG(error) << "async_op_done(" << name << ") without a matching async_op_start()";
    return;
  }
  pending_.erase(i);
  if (pending_.empty()) {
    lock.unlock();
    cv_.notify_all();
  }
}

} // namespace detail
} // namespace lw
