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
#include "lw/cancellation_token.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace lw {

struct cancellation_token::state {
  state()
      : mu()
      , cancelled(false)
      , token_gen(0)
      , callbacks() {
  }

  std::mutex mu;
  std::atomic<bool> cancelled;
  long token_gen;
  std::map<long, callback_type> callbacks;
};

cancellation_token::cancellation_token()
    : state_(std::make_shared<state>()) {
}

void cancellation_token::cancel() {
  std::lock_guard<std::mutex> lock(state_->mu);
  if (state_->cancelled.exchange(true)) {
    return;
  }
  // ... the callbacks run with the lock held, that is what makes unsubscribe() wait for a running callback ...
  for (auto const& kv : state_->callbacks) {
    kv.second();
  }
  state_->callbacks.clear();
}

bool cancellation_token::cancelled() const {
  return state_->cancelled.load();
}

long cancellation_token::subscribe(callback_type callback) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  if (state_->cancelled.load()) {
    return 0;
  }
  auto token = ++state_->token_gen;
  state_->callbacks.emplace(token, std::move(callback));
  return token;
}

void cancellation_token::unsubscribe(long token) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->callbacks.erase(token);
}

} // namespace lw
