#ifndef lw_abortable_hpp
#define lw_abortable_hpp

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace lw {

/**
 * Receive notifications of unrecoverable failures.
 *
 * The node watchers call abort() when they cannot reach the coordination service after exhausting their retry
 * policy.  Typically the application shuts down, or at least stops trusting the cached leader address.  The handler
 * is called from the thread running the completion queue, it must not block for long, and it must not delete the
 * watcher that called it.
 */
class abortable {
public:
  virtual ~abortable() {}

  /// Report an unrecoverable failure, @a why describes it.
  virtual void abort(std::string const& why) = 0;
};

/**
 * An adaptor that converts any Functor into a @c lw::abortable.
 */
template <typename Functor>
class abort_to_functor : public abortable {
public:
  explicit abort_to_functor(Functor f)
      : functor(std::move(f)) {
  }

  virtual void abort(std::string const& why) override {
    functor(why);
  }

private:
  Functor functor;
};

/**
 * Create a @c lw::abortable shared pointer from a functor.
 *
 * @code
 * auto handler = lw::make_abortable([](std::string const& why) { LW_LOG(critical) << why; });
 * @endcode
 */
template <typename Functor>
std::shared_ptr<abortable> make_abortable(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<abort_to_functor<functor_type>>(std::forward<Functor>(f));
}

} // namespace lw

#endif // lw_abortable_hpp
