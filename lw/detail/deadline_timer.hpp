#ifndef lw_detail_deadline_timer_hpp
#define lw_detail_deadline_timer_hpp

#include <lw/detail/base_async_op.hpp>

#include <grpc++/alarm.h>

#include <chrono>
#include <memory>

namespace lw {
namespace detail {

/**
 * A timer posted to the completion queue, the node watchers use them to pace their reconnection attempts.
 *
 * The callback receives ok == true when the deadline expires, and ok == false when the timer is cancelled.
 */
struct deadline_timer : public base_async_op {
  /// Post the timer to @a cq, only lw::detail::default_grpc_interceptor calls this.
  void arm(grpc::CompletionQueue* cq, void* tag) {
    alarm_ = std::make_unique<grpc::Alarm>();
    alarm_->Set(cq, deadline, tag);
  }

  /**
   * Cancel the timer, it is safe to call from any thread.
   *
   * The callback still runs, in the completion queue thread, and it is there where the resources are released.
   */
  void cancel() {
    if (alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;

private:
  std::unique_ptr<grpc::Alarm> alarm_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_deadline_timer_hpp
