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
#include "lw/detail/base_completion_queue.hpp"
#include <lw/assert_throw.hpp>
#include <lw/log.hpp>

#include <sstream>

namespace lw {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  shutdown();
  // ... gRPC requires the queue to be drained before it is destroyed ...
  void* tag = nullptr;
  bool ok = false;
  while (queue_.Next(&tag, &ok)) {
    if (auto op = unregister_op(tag)) {
      LW_LOG(debug) << "discarding " << op->name << " in completion queue destructor";
    }
  }
  // ... the callbacks of the remaining operations may reference a destroyed watcher, they cannot be called ...
  auto leftover = pending_operations();
  if (leftover != 0) {
    LW_LOG(error) << "completion queue deleted with " << leftover << " pending operations:\n"
                  << describe_pending_operations();
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto status = queue_.AsyncNext(&tag, &ok, std::chrono::system_clock::now() + loop_timeout);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      LW_LOG(trace) << "completion queue shutdown, exit loop";
      return;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    auto op = unregister_op(tag);
    if (not op) {
      LW_LOG(error) << "unknown tag " << tag << " returned by the completion queue";
      continue;
    }
    LW_LOG(trace) << "completing " << op->name << " ok=" << ok;
    op->complete(ok);
  }
}

void base_completion_queue::shutdown() {
  if (not shutdown_.exchange(true)) {
    queue_.Shutdown();
  }
}

std::size_t base_completion_queue::pending_operations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

std::string base_completion_queue::describe_pending_operations() const {
  std::ostringstream os;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto const& kv : pending_ops_) {
    os << kv.second->name << "\n";
  }
  return os.str();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = op.get();
  std::lock_guard<std::mutex> lock(mu_);
  bool inserted = pending_ops_.emplace(tag, std::move(op)).second;
  LW_ASSERT_THROW_MSG(inserted, where);
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = pending_ops_.find(tag);
  if (i == pending_ops_.end()) {
    return std::shared_ptr<base_async_op>();
  }
  auto op = std::move(i->second);
  pending_ops_.erase(i);
  return op;
}

} // namespace detail
} // namespace lw
