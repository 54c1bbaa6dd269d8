//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
#include "lw/master_address_tracker.hpp"
#include <lw/log.hpp>

#include <sstream>
#include <stdexcept>

namespace {
std::unique_ptr<lw::server_address> decode(lw::watched_value::value_type const& value) {
  if (not value) {
    return std::unique_ptr<lw::server_address>();
  }
  return std::make_unique<lw::server_address>(lw::server_address::parse(*value));
}
} // anonymous namespace

namespace lw {

/**
 * Acquire the right to wait on the tracker, and release it on destruction.
 *
 * A plain std::mutex would do, except that a thread blocked on a mutex cannot time out or be cancelled.
 */
class master_address_tracker::wait_turn {
public:
  wait_turn(
      master_address_tracker& tracker, std::chrono::steady_clock::time_point deadline, bool unbounded,
      cancellation_token const& token)
      : tracker_(tracker)
      , token_(token)
      , cancel_id_(token.subscribe([this]() {
        std::lock_guard<std::mutex> lock(tracker_.mu_);
        tracker_.cv_.notify_all();
      }))
      , acquired_(false) {
    std::unique_lock<std::mutex> lock(tracker_.mu_);
    auto ready = [this]() { return not tracker_.waiting_ or token_.cancelled(); };
    if (unbounded) {
      tracker_.cv_.wait(lock, ready);
    } else if (not tracker_.cv_.wait_until(lock, deadline, ready)) {
      return;
    }
    if (token_.cancelled()) {
      return;
    }
    tracker_.waiting_ = true;
    acquired_ = true;
  }

  ~wait_turn() {
    // ... the lock must not be held here, a concurrent cancel() holds the token lock and waits for tracker_.mu_ ...
    token_.unsubscribe(cancel_id_);
    if (not acquired_) {
      return;
    }
    std::unique_lock<std::mutex> lock(tracker_.mu_);
    tracker_.waiting_ = false;
    lock.unlock();
    tracker_.cv_.notify_all();
  }

  wait_turn(wait_turn const&) = delete;
  wait_turn& operator=(wait_turn const&) = delete;

  bool acquired() const {
    return acquired_;
  }

private:
  master_address_tracker& tracker_;
  cancellation_token const& token_;
  long cancel_id_;
  bool acquired_;
};

std::string master_address_tracker::log_identity() {
  return "master_address_tracker";
}

master_address_tracker::master_address_tracker(watched_value const& node)
    : node_(node)
    , mu_()
    , cv_()
    , waiting_(false) {
}

std::unique_ptr<server_address> master_address_tracker::master_address() const {
  return decode(node_.current_value());
}

bool master_address_tracker::has_master() const {
  return node_.has_value();
}

std::unique_ptr<server_address> master_address_tracker::wait_for_master(std::chrono::milliseconds timeout) {
  return wait_for_master(timeout, cancellation_token());
}

std::unique_ptr<server_address>
master_address_tracker::wait_for_master(std::chrono::milliseconds timeout, cancellation_token const& token) {
  if (timeout < std::chrono::milliseconds(0)) {
    std::ostringstream os;
    os << "master_address_tracker::wait_for_master(" << node_.path() << ") - negative timeout (" << timeout.count()
       << "ms)";
    throw std::invalid_argument(os.str());
  }
  auto const now = std::chrono::steady_clock::now();
  bool const unbounded = timeout == std::chrono::milliseconds(0) or detail::beyond_steady_clock(timeout, now);
  auto const deadline = unbounded ? std::chrono::steady_clock::time_point::max() : now + timeout;

  watched_value::value_type value;
  {
    wait_turn turn(*this, deadline, unbounded, token);
    if (token.cancelled() and not turn.acquired()) {
      std::ostringstream os;
      os << "master_address_tracker::wait_for_master(" << node_.path() << ") - cancelled";
      throw wait_cancelled(os.str());
    }
    if (not turn.acquired()) {
      // ... the deadline expired while other threads were waiting, report whatever is there now ...
      value = node_.current_value();
    } else if (unbounded) {
      value = node_.await_value(std::chrono::milliseconds(0), token);
    } else {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining > std::chrono::milliseconds(0)) {
        value = node_.await_value(remaining, token);
      } else {
        value = node_.current_value();
      }
    }
  }
  if (not value) {
    LW_LOG_AS(info, node_.log_identity()) << "no master at " << node_.path() << " after " << timeout.count() << "ms";
  }
  return decode(value);
}

} // namespace lw
