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
#include "lw/watched_value.hpp"
#include <lw/log.hpp>

#include <sstream>
#include <stdexcept>

namespace {
/// Unsubscribe from a cancellation token when the wait completes, even if it raises.
class cancel_subscription {
public:
  cancel_subscription(lw::cancellation_token const& token, lw::cancellation_token::callback_type callback)
      : token_(token)
      , id_(token.subscribe(std::move(callback))) {
  }
  ~cancel_subscription() {
    token_.unsubscribe(id_);
  }

  cancel_subscription(cancel_subscription const&) = delete;
  cancel_subscription& operator=(cancel_subscription const&) = delete;

private:
  lw::cancellation_token const& token_;
  long id_;
};
} // anonymous namespace

namespace lw {

watched_value::watched_value(std::string path, std::string log_identity)
    : path_(std::move(path))
    , log_identity_(std::move(log_identity))
    , mu_()
    , cv_()
    , value_()
    , version_(0)
    , stopped_(false) {
}

watched_value::value_type watched_value::current_value() const {
  std::lock_guard<std::mutex> lock(mu_);
  return value_;
}

bool watched_value::has_value() const {
  std::lock_guard<std::mutex> lock(mu_);
  return (bool)value_;
}

std::uint64_t watched_value::version() const {
  std::lock_guard<std::mutex> lock(mu_);
  return version_;
}

watched_value::value_type watched_value::await_value(std::chrono::milliseconds timeout) const {
  return await_value(timeout, cancellation_token());
}

watched_value::value_type
watched_value::await_value(std::chrono::milliseconds timeout, cancellation_token const& token) const {
  if (timeout < std::chrono::milliseconds(0)) {
    std::ostringstream os;
    os << "watched_value::await_value(" << path_ << ") - negative timeout (" << timeout.count() << "ms)";
    throw std::invalid_argument(os.str());
  }
  // ... subscribe before taking the lock, the callback takes the lock too, and must be able to run while we wait ...
  cancel_subscription subscription(token, [this]() {
    std::lock_guard<std::mutex> lock(mu_);
    cv_.notify_all();
  });

  auto const now = std::chrono::steady_clock::now();
  bool const unbounded = timeout == std::chrono::milliseconds(0) or detail::beyond_steady_clock(timeout, now);
  auto const deadline = unbounded ? std::chrono::steady_clock::time_point::max() : now + timeout;
  std::unique_lock<std::mutex> lock(mu_);
  auto ready = [this, &token]() { return (bool)value_ or stopped_ or token.cancelled(); };
  if (unbounded) {
    cv_.wait(lock, ready);
  } else if (not cv_.wait_until(lock, deadline, ready)) {
    LW_LOG_AS(debug, log_identity_) << "timeout waiting for " << path_ << " after " << timeout.count() << "ms";
    return value_type();
  }
  if (value_) {
    return value_;
  }
  if (token.cancelled()) {
    std::ostringstream os;
    os << "watched_value::await_value(" << path_ << ") - cancelled";
    throw wait_cancelled(os.str());
  }
  return value_type();
}

void watched_value::update(std::string value) {
  auto v = std::make_shared<std::string const>(std::move(value));
  std::unique_lock<std::mutex> lock(mu_);
  value_ = std::move(v);
  ++version_;
  lock.unlock();
  cv_.notify_all();
}

void watched_value::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  value_.reset();
  ++version_;
}

void watched_value::stop() {
  std::unique_lock<std::mutex> lock(mu_);
  stopped_ = true;
  lock.unlock();
  cv_.notify_all();
}

bool watched_value::stopped() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stopped_;
}

namespace detail {
bool beyond_steady_clock(std::chrono::milliseconds timeout, std::chrono::steady_clock::time_point now) {
  auto const headroom = std::chrono::steady_clock::time_point::max() - now;
  return timeout > std::chrono::duration_cast<std::chrono::milliseconds>(headroom);
}
} // namespace detail

} // namespace lw
