#ifndef lw_log_hpp
#define lw_log_hpp
/**
 * @file
 *
 * The leadwatch logging macros.
 *
 * @code
 * LW_LOG(info) << "connected to " << address;
 * LW_LOG_AS(warning, node.log_identity()) << "watch on " << node.path() << " compacted";
 * @endcode
 *
 * The stream expression is only evaluated if the level is enabled, both at compile-time (see LW_MIN_SEVERITY) and at
 * run-time (see lw::log::min_severity()).
 */
#include <lw/detail/null_stream.hpp>
#include <lw/log_severity.hpp>
#include <lw/log_sink.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#define LW_PP_CAT(a, b) a##b

/// A variable name for the log line, unique per source line so LW_LOG() does not shadow the caller's variables.
#define LW_LOGGER_IDENTIFIER LW_PP_CAT(lw_log_line_, __LINE__)

/**
 * Log to the lw::log object @a sink, tagging the line with @a identity.
 *
 * The for-loop body is the stream expression that follows the macro, it runs at most once, and the increment
 * statement sends the line to the sink.
 */
#define LW_LOG_I(level, sink, identity)                                                                                \
  for (auto LW_LOGGER_IDENTIFIER = lw::log_line<lw::level_compile_time_disabled(lw::severity::level)>(                 \
           lw::severity::level, __func__, __FILE__, __LINE__, sink, identity);                                         \
       (bool)LW_LOGGER_IDENTIFIER; LW_LOGGER_IDENTIFIER.write_to(sink))                                                \
  LW_LOGGER_IDENTIFIER.get()

/// Declare a log line variable, for messages assembled over several statements.
#define LW_LOGGER_DECL(level, sink, name)                                                                              \
  lw::log_line<lw::level_compile_time_disabled(lw::severity::level)> name(                                             \
      lw::severity::level, __func__, __FILE__, __LINE__, sink, "")

#ifndef LW_LOG
#define LW_LOG(level) LW_LOG_I(level, lw::log::instance(), "")
#endif // LW_LOG

#ifndef LW_LOG_AS
/**
 * Log a line on behalf of @a identity, it appears as "[identity]" after the severity.
 *
 * A lw::watched_value logs with the identity of the component that consumes it (e.g. "master_address_tracker"), so
 * the watch lines can be traced back to their purpose.
 */
#define LW_LOG_AS(level, identity) LW_LOG_I(level, lw::log::instance(), identity)
#endif // LW_LOG_AS

namespace lw {

/// Return true if lines at @a lvl are removed at compile-time.
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < severity::LOWEST_ENABLED;
}

/**
 * Dispatch the log lines to the sinks.
 *
 * The library logs to the singleton returned by instance(), tests create their own objects.
 */
class log {
public:
  log()
      : min_severity_(severity::LOWEST)
      , sinks_()
      , last_token_(0) {
  }

  static log& instance();

  /// Add a sink, return a token for remove_sink().
  long add_sink(std::shared_ptr<log_sink> sink);

  /// Remove the sink for @a token, unknown tokens are ignored.
  void remove_sink(long token);

  void clear_sinks();

  /// Send @a msg to all the sinks, unless @a sev is below min_severity().
  void write(severity sev, std::string&& msg);

  /// Return true if lines at @a sev would reach at least one sink.
  bool enabled(severity sev) const {
    std::lock_guard<std::mutex> guard(mu_);
    return sev >= min_severity_ and not sinks_.empty();
  }

  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::map<long, std::shared_ptr<log_sink>> sinks_;
  long last_token_;

  static std::unique_ptr<log> singleton_;
};

/**
 * A log line disabled at compile-time.
 *
 * It never opens, so the stream expression in LW_LOG() is dead code.
 */
template <bool disabled>
class log_line {
public:
  log_line(severity, char const*, char const*, int, log&, std::string const&) {
  }

  explicit operator bool() const {
    return false;
  }

  detail::null_stream& get() {
    return os_;
  }

  void write_to(log&) {
  }

private:
  detail::null_stream os_;
};

/// A log line formatted into a std::ostringstream, with the location appended when it is written.
template <>
class log_line<false> {
public:
  log_line(severity sev, char const* function, char const* file, int lineno, log& sink, std::string const& identity);

  /// False once written, or if @c lw::log would discard the line.
  explicit operator bool() const {
    return open_;
  }

  std::ostream& get() {
    return os_;
  }

  void write_to(log& sink);

private:
  std::ostringstream os_;
  severity sev_;
  char const* function_;
  char const* file_;
  int lineno_;
  bool open_;
};

} // namespace lw

#endif // lw_log_hpp
