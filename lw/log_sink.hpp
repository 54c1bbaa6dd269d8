#ifndef lw_log_sink_hpp
#define lw_log_sink_hpp

#include <lw/log_severity.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace lw {

/**
 * Receive the formatted log lines from lw::log.
 *
 * leadwatch never writes to stderr or syslog on its own, the application decides where the lines go by adding sinks
 * to lw::log::instance().  Sinks may be called from any thread, including the completion queue thread.
 */
class log_sink {
public:
  virtual ~log_sink() = default;

  virtual void log(severity sev, std::string&& message) = 0;
};

namespace detail {
/// Adapt a functor with the signature of log_sink::log().
template <typename Functor>
class functor_log_sink : public log_sink {
public:
  explicit functor_log_sink(Functor f)
      : functor_(std::move(f)) {
  }

  void log(severity sev, std::string&& message) override {
    functor_(sev, std::move(message));
  }

private:
  Functor functor_;
};
} // namespace detail

/**
 * Wrap a functor, typically a lambda, into a lw::log_sink.
 *
 * @code
 * lw::log::instance().add_sink(lw::make_log_sink([](lw::severity sev, std::string&& msg) {
 *   syslog(LOG_INFO, "%s", msg.c_str());
 * }));
 * @endcode
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  return std::make_shared<detail::functor_log_sink<typename std::decay<Functor>::type>>(std::forward<Functor>(f));
}

/**
 * Write each line at or above @a min_severity to @a os.
 *
 * The sink serializes its writes, @a os must outlive it.
 */
std::shared_ptr<log_sink> make_ostream_log_sink(std::ostream& os, severity min_severity = severity::LOWEST);

} // namespace lw

#endif // lw_log_sink_hpp
