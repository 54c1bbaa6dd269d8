#ifndef lw_master_address_tracker_hpp
#define lw_master_address_tracker_hpp
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
#include <lw/server_address.hpp>
#include <lw/watched_value.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace lw {

/**
 * Track the address of the current master.
 *
 * The master publishes its address, as a "host:port" string, in a well-known etcd key.  A lw::node_watcher keeps a
 * lw::watched_value up to date with the contents of that key, and this class decodes the value on each read.  It
 * does not store any address, and it does not control the watcher: starting and stopping the watch is the job of
 * whoever owns the watcher.
 *
 * @code
 * lw::watched_value node("/cluster/master", lw::master_address_tracker::log_identity());
 * lw::etcd_node_watcher watcher(queue, channel, node, abort_handler);
 * lw::master_address_tracker tracker(node);
 * watcher.startup();
 * auto master = tracker.wait_for_master(std::chrono::seconds(30));
 * if (not master) {
 *   // ... no master within 30 seconds ...
 * }
 * @endcode
 */
class master_address_tracker {
public:
  /// The identity used by the trackers in their log lines.
  static std::string log_identity();

  /**
   * Create a tracker for the value in @a node.
   *
   * @param node the value published by the master, it must outlive this object.
   */
  explicit master_address_tracker(watched_value const& node);

  master_address_tracker(master_address_tracker const&) = delete;
  master_address_tracker& operator=(master_address_tracker const&) = delete;

  /// The etcd key where the master publishes its address.
  std::string const& path() const {
    return node_.path();
  }

  /**
   * Return the address of the current master, if any.
   *
   * Never blocks.
   *
   * @returns the address, or null if there is no master.
   * @throws lw::malformed_address if the value published by the master is not a "host:port" string.
   */
  std::unique_ptr<server_address> master_address() const;

  /// Return true if there is a master, without decoding its address.
  bool has_master() const;

  /**
   * Block until there is a master, the timeout expires, or @a token is cancelled.
   *
   * Only one thread at a time waits on each tracker, concurrent callers wait in turn, though each caller still honors
   * its own timeout and token while waiting for its turn.  Notice that a null result means that no master was observed
   * before the deadline, not that there is no master at all.
   *
   * @param timeout how long to wait, zero means until there is a master.
   * @param token cancel the wait.
   * @returns the address of the master, or null if the timeout expired (or the watch stopped) first.
   * @throws lw::wait_cancelled if @a token is cancelled while waiting.
   * @throws lw::malformed_address if the value published by the master is not a "host:port" string.
   * @throws std::invalid_argument if @a timeout is negative.
   */
  std::unique_ptr<server_address> wait_for_master(std::chrono::milliseconds timeout, cancellation_token const& token);

  /// Block until there is a master or the timeout expires.
  std::unique_ptr<server_address> wait_for_master(std::chrono::milliseconds timeout);

private:
  class wait_turn;

  watched_value const& node_;

  /// Serialize the calls to wait_for_master().
  std::mutex mu_;
  std::condition_variable cv_;
  bool waiting_;
};

} // namespace lw

#endif // lw_master_address_tracker_hpp
