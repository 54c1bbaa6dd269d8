#ifndef lw_detail_null_stream_hpp
#define lw_detail_null_stream_hpp

#include <ostream>

namespace lw {
namespace detail {

/**
 * The stream for log lines disabled at compile-time.
 *
 * LW_LOG() expands to an expression streaming into this object when the level is below LW_MIN_SEVERITY, every
 * operator<< is a no-op, so the optimizer can discard the whole expression.
 */
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  null_stream& operator<<(char const*) {
    return *this;
  }

  /// Manipulators (std::endl, std::hex) are function templates, they need an overload of their own.
  null_stream& operator<<(std::ostream& (*)(std::ostream&)) {
    return *this;
  }
};

} // namespace detail
} // namespace lw

#endif // lw_detail_null_stream_hpp
