#ifndef lw_detail_reconnect_policies_hpp
#define lw_detail_reconnect_policies_hpp
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

#include <chrono>
#include <iosfwd>
#include <memory>

namespace lw {
namespace detail {

/**
 * Choose how long a node watcher waits before it reconnects a broken watch stream.
 *
 * The watcher keeps a prototype of each policy and clones it whenever etcd confirms a new watch, so the policies only
 * see consecutive failures.
 */
class backoff_policy {
public:
  virtual ~backoff_policy() = default;

  /// Report a failure, return the delay before the next attempt.
  virtual std::chrono::milliseconds on_failure() = 0;

  /// Create a copy of this policy in its initial state.
  virtual std::unique_ptr<backoff_policy> clone() const = 0;

  /// Describe the policy for the log.
  virtual void print(std::ostream& os) const = 0;
};

/// Decide when a node watcher stops reconnecting and reports the failure to its lw::abortable.
class retry_policy {
public:
  virtual ~retry_policy() = default;

  /// Report a failure, return true if the watcher should try again.
  virtual bool on_failure() = 0;

  /// Create a copy of this policy in its initial state.
  virtual std::unique_ptr<retry_policy> clone() const = 0;

  /// Describe the policy for the log.
  virtual void print(std::ostream& os) const = 0;
};

std::ostream& operator<<(std::ostream& os, backoff_policy const& x);
std::ostream& operator<<(std::ostream& os, retry_policy const& x);

/// Double the delay after each failure, starting at @c min_delay and capped at @c max_delay.
class exponential_backoff : public backoff_policy {
public:
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay)
      : exponential_backoff(
            std::chrono::duration_cast<std::chrono::milliseconds>(min_delay),
            std::chrono::duration_cast<std::chrono::milliseconds>(max_delay)) {
  }
  exponential_backoff(std::chrono::milliseconds min_delay, std::chrono::milliseconds max_delay);

  std::chrono::milliseconds on_failure() override;
  std::unique_ptr<backoff_policy> clone() const override;
  void print(std::ostream& os) const override;

private:
  std::chrono::milliseconds min_delay_;
  std::chrono::milliseconds max_delay_;
  std::chrono::milliseconds next_delay_;
};

/// Allow a fixed number of consecutive reconnection attempts.
class limited_attempts : public retry_policy {
public:
  explicit limited_attempts(int maximum_attempts);

  bool on_failure() override;
  std::unique_ptr<retry_policy> clone() const override;
  void print(std::ostream& os) const override;

private:
  int maximum_attempts_;
  int attempts_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_reconnect_policies_hpp
