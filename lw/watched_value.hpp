#ifndef lw_watched_value_hpp
#define lw_watched_value_hpp
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

#include <lw/cancellation_token.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lw {

/**
 * The last known value of a watched etcd key.
 *
 * A watcher (see lw::node_watcher) calls update() and clear() from its own thread as it receives notifications for
 * the key, while any number of application threads read the value.  Readers either take a snapshot with
 * current_value(), or block in await_value() until a value is present.
 *
 * The value is held as an immutable snapshot, readers get a shared pointer to it and never observe a partial update.
 */
class watched_value {
public:
  //@{
  /// @name type traits
  /// A snapshot of the value, null if the key does not exist.
  using value_type = std::shared_ptr<std::string const>;
  //@}

  /**
   * Create a new value, initially absent.
   *
   * @param path the etcd key this value tracks.
   * @param log_identity the name used to attribute the log lines about this value, typically the name of the
   *   component that uses the value.
   */
  watched_value(std::string path, std::string log_identity);

  watched_value(watched_value const&) = delete;
  watched_value& operator=(watched_value const&) = delete;

  std::string const& path() const {
    return path_;
  }
  std::string const& log_identity() const {
    return log_identity_;
  }

  /// Return a snapshot of the current value, null if the key does not exist or was never observed.
  value_type current_value() const;

  /// Return true if the key currently exists.
  bool has_value() const;

  /**
   * Return the number of updates and deletions recorded so far.
   *
   * Mostly useful in tests, to wait until a notification was processed.
   */
  std::uint64_t version() const;

  /**
   * Block until the key exists, the timeout expires, the value is stopped, or @a token is cancelled.
   *
   * The check for an existing value and the wait for a new one happen under the same lock that update() uses, a value
   * recorded before this call starts is always returned immediately.
   *
   * @param timeout how long to wait, zero (or a timeout past the range of std::chrono::steady_clock) means wait until
   *   a value is present.
   * @param token cancel the wait.
   * @returns the value, or null if the timeout expired or the value was stopped before a value was present.
   * @throws lw::wait_cancelled if @a token is cancelled before a value is present.
   * @throws std::invalid_argument if @a timeout is negative.
   */
  value_type await_value(std::chrono::milliseconds timeout, cancellation_token const& token) const;

  /// Block until the key exists or the timeout expires, see the overload with a cancellation token.
  value_type await_value(std::chrono::milliseconds timeout) const;

  /// Record that the key was created or updated, wake up all the threads blocked in await_value().
  void update(std::string value);

  /// Record that the key was deleted.
  void clear();

  /**
   * Stop waiting for values.
   *
   * Wakes up all the threads blocked in await_value(), which return the current value, and makes future calls return
   * without blocking.  The value can still be read and updated.
   */
  void stop();

  /// Return true if stop() was called.
  bool stopped() const;

private:
  std::string const path_;
  std::string const log_identity_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  value_type value_;
  std::uint64_t version_;
  bool stopped_;
};

namespace detail {
/**
 * Return true if @a now + @a timeout is past the last time point std::chrono::steady_clock can represent.
 *
 * Such timeouts (std::chrono::milliseconds::max() is a common one) overflow the deadline computation, the waits treat
 * them as unbounded.
 */
bool beyond_steady_clock(std::chrono::milliseconds timeout, std::chrono::steady_clock::time_point now);
} // namespace detail

} // namespace lw

#endif // lw_watched_value_hpp
