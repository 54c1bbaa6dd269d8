#ifndef lw_log_severity_hpp
#define lw_log_severity_hpp
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

#include <iosfwd>
#include <string>

#ifndef LW_MIN_SEVERITY
/**
 * Log lines below this severity compile to nothing.
 *
 * The watch callbacks run for every event etcd sends, their trace and debug lines cost nothing unless the build lowers
 * this value (see the LEADWATCH_MIN_SEVERITY CMake option).
 */
#define LW_MIN_SEVERITY info
#endif // LW_MIN_SEVERITY

namespace lw {

/**
 * The severity of a log line, in increasing order, following syslog(3).
 *
 * How the library uses them:
 * - trace: every completed gRPC operation.
 * - debug: watch creation and cancellation.
 * - info: the master address changed, or the watch is reconnecting.
 * - warning: the watch was cancelled or compacted and must re-synchronize.
 * - error: a Range or Watch call failed.
 * - critical: the watcher gave up on etcd and called its lw::abortable.
 */
enum class severity {
  trace,
  debug,
  info,
  notice,
  warning,
  error,
  critical,
  alert,
  fatal,

  LOWEST = int(trace),
  HIGHEST = int(fatal),
  LOWEST_ENABLED = int(LW_MIN_SEVERITY),
};

/// Print the lowercase name of the level, as used in the log lines.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert the name of a level back to its value, the example programs take the log level in the command-line.
 *
 * @throws std::invalid_argument if @a name is not one of the names printed by operator<<.
 */
severity parse_severity(std::string const& name);

} // namespace lw

#endif // lw_log_severity_hpp
