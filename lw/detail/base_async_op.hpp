#ifndef lw_detail_base_async_op_hpp
#define lw_detail_base_async_op_hpp

#include <functional>
#include <string>

namespace lw {
namespace detail {

/**
 * The state of one pending gRPC operation: a Range call, a Watch stream read or write, or a reconnect timer.
 *
 * lw::completion_queue creates one of the derived types for each request, and uses its address as the gRPC tag.  When
 * the queue returns the tag the operation is completed with the @c ok flag reported by gRPC, and then released, so
 * callbacks must copy anything they want to keep.
 */
struct base_async_op {
  virtual ~base_async_op() = default;

  /// Invoke the callback, @a ok is false if the operation was cancelled or the stream is closed.
  void complete(bool ok) {
    callback(*this, ok);
  }

  /// Set by lw::completion_queue, it downcasts to the derived type before calling the application functor.
  std::function<void(base_async_op&, bool)> callback;

  /// Used in the log lines, and by the mocked tests to tell operations apart.
  std::string name;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_base_async_op_hpp
