#ifndef lw_cancellation_token_hpp
#define lw_cancellation_token_hpp
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

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace lw {

/**
 * Raised by blocking operations when their lw::cancellation_token is cancelled.
 *
 * A cancelled wait is neither a timeout nor the absence of a value, callers must be able to tell them apart.
 */
class wait_cancelled : public std::runtime_error {
public:
  explicit wait_cancelled(std::string const& what)
      : std::runtime_error(what) {
  }
};

/**
 * Interrupt blocking operations from another thread.
 *
 * C++ threads cannot be interrupted, instead the blocking operations in leadwatch accept a token, and return (by
 * raising lw::wait_cancelled) as soon as any copy of the token is cancelled.  Copies of a token share the same state,
 * a token can be cancelled only once, and cannot be reset.
 *
 * @code
 * lw::cancellation_token token;
 * std::thread t([&tracker, token]() {
 *   try {
 *     auto addr = tracker.wait_for_master(std::chrono::milliseconds(0), token);
 *   } catch(lw::wait_cancelled const&) {
 *     // ... shutting down ...
 *   }
 * });
 * token.cancel();
 * t.join();
 * @endcode
 */
class cancellation_token {
public:
  /// The type of the callbacks invoked on cancellation.
  using callback_type = std::function<void()>;

  /// Create a new token, not cancelled.
  cancellation_token();

  /**
   * Cancel all the operations using this token, or any of its copies.
   *
   * Calling cancel() more than once has no effect.
   */
  void cancel();

  /// Return true if cancel() was called on this token, or any of its copies.
  bool cancelled() const;

  /**
   * Call @a callback when the token is cancelled.
   *
   * This is intended for the implementation of blocking operations, which need to wake up their condition variables.
   * The callback is invoked from the thread calling cancel(), with an internal lock held, it must not call any member
   * function of the token.  unsubscribe() blocks until a running callback returns, so the resources used by the
   * callback can be released once unsubscribe() returns.
   *
   * @returns a token to later remove the callback, or 0 if the token was already cancelled.  In the latter case the
   * callback is not invoked, callers must check cancelled() after subscribing.
   */
  long subscribe(callback_type callback) const;

  /// Remove a callback, unknown tokens (including 0) are ignored.
  void unsubscribe(long token) const;

private:
  struct state;
  std::shared_ptr<state> state_;
};

} // namespace lw

#endif // lw_cancellation_token_hpp
