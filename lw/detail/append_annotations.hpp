#ifndef lw_detail_append_annotations_hpp
#define lw_detail_append_annotations_hpp

#include <initializer_list>
#include <utility>

namespace lw {
namespace detail {

/**
 * Stream each annotation into @a os, in order.
 *
 * The watcher adds context (key, revision, operation name) to its log lines and exception messages with this.
 *
 * @tparam Stream a std::ostream, or lw::detail::null_stream for log lines disabled at compile-time.
 */
template <typename Stream, typename... Annotations>
void append_annotations(Stream& os, Annotations&&... a) {
  (void)std::initializer_list<int>{0, ((void)(os << std::forward<Annotations>(a)), 0)...};
}

} // namespace detail
} // namespace lw

#endif // lw_detail_append_annotations_hpp
