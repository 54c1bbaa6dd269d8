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
#include "lw/detail/reconnect_policies.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lw {
namespace detail {

std::ostream& operator<<(std::ostream& os, backoff_policy const& x) {
  x.print(os);
  return os;
}

std::ostream& operator<<(std::ostream& os, retry_policy const& x) {
  x.print(os);
  return os;
}

exponential_backoff::exponential_backoff(std::chrono::milliseconds min_delay, std::chrono::milliseconds max_delay)
    : min_delay_(min_delay)
    , max_delay_(max_delay)
    , next_delay_(min_delay) {
  if (min_delay_.count() <= 0 or min_delay_ > max_delay_) {
    std::ostringstream os;
    os << "exponential_backoff() - invalid range [" << min_delay_.count() << "ms," << max_delay_.count()
       << "ms], the minimum must be positive and not larger than the maximum";
    throw std::invalid_argument(os.str());
  }
}

std::chrono::milliseconds exponential_backoff::on_failure() {
  auto delay = next_delay_;
  next_delay_ = std::min(2 * next_delay_, max_delay_);
  return delay;
}

std::unique_ptr<backoff_policy> exponential_backoff::clone() const {
  return std::make_unique<exponential_backoff>(min_delay_, max_delay_);
}

void exponential_backoff::print(std::ostream& os) const {
  os << "exponential_backoff[" << min_delay_.count() << "ms," << max_delay_.count() << "ms]";
}

limited_attempts::limited_attempts(int maximum_attempts)
    : maximum_attempts_(maximum_attempts)
    , attempts_(0) {
  if (maximum_attempts_ <= 0) {
    std::ostringstream os;
    os << "limited_attempts() - maximum_attempts (" << maximum_attempts_ << ") must be positive";
    throw std::invalid_argument(os.str());
  }
}

bool limited_attempts::on_failure() {
  return ++attempts_ <= maximum_attempts_;
}

std::unique_ptr<retry_policy> limited_attempts::clone() const {
  return std::make_unique<limited_attempts>(maximum_attempts_);
}

void limited_attempts::print(std::ostream& os) const {
  os << "limited_attempts[" << attempts_ << "/" << maximum_attempts_ << "]";
}

} // namespace detail
} // namespace lw
