#ifndef lw_active_completion_queue_hpp
#define lw_active_completion_queue_hpp
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

#include <lw/completion_queue.hpp>

#include <memory>
#include <thread>

namespace lw {

/**
 * A completion queue together with the thread running its event loop.
 *
 * The destructor shuts down the queue and then joins the thread, in that order, so the owner never has to worry about
 * the order of destruction of the two.  All the callbacks of the etcd binding run in this thread.
 */
class active_completion_queue {
public:
  /// Create a new completion queue and a thread to run it.
  active_completion_queue();

  /// Take ownership of an existing queue and the thread calling q->run().
  active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t);

  active_completion_queue(active_completion_queue&& rhs) noexcept;
  active_completion_queue& operator=(active_completion_queue&& rhs) noexcept;
  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  explicit operator bool() const {
    return static_cast<bool>(queue_);
  }

  completion_queue<>& cq() {
    return *queue_;
  }

private:
  /// Shutdown the queue and join the thread, leaves the object empty.
  void stop();

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace lw

#endif // lw_active_completion_queue_hpp
