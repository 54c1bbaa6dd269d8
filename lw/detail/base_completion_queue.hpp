#ifndef lw_detail_base_completion_queue_hpp
#define lw_detail_base_completion_queue_hpp

#include <lw/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lw {
namespace detail {
/// Grants the unit tests access to the raw grpc::CompletionQueue.
struct base_completion_queue_test_only;

/**
 * The part of lw::completion_queue<> that does not depend on the interceptor.
 *
 * It owns the grpc::CompletionQueue and the operations posted to it.  The operation address is the gRPC tag, the
 * queue keeps a reference to each operation until its tag is returned by gRPC, so the watcher can drop its own
 * references at any time.
 */
class base_completion_queue {
public:
  /// How often run() wakes up to check for shutdown().
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Complete the operations as gRPC reports them, until shutdown() is called.
  void run();

  /// Stop the loop in run(), it is safe to call more than once and from any thread.
  void shutdown();

  /// Return the number of operations posted to the queue that have not completed.
  std::size_t pending_operations() const;

  /// Return the names of the pending operations, one per line, for the log.
  std::string describe_pending_operations() const;

protected:
  friend struct ::lw::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Keep @a op until its tag is returned, @a where names the caller in the error if the operation is already there.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Release the operation for @a tag, null if the tag is not known.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  std::unordered_map<void*, std::shared_ptr<base_async_op>> pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_base_completion_queue_hpp
