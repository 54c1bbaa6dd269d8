#ifndef lw_assert_throw_hpp
#define lw_assert_throw_hpp
/**
 * @file
 *
 * Check internal invariants, raising lw::assertion_error when they do not hold.
 *
 * Unlike assert(3) the checks remain in release builds, a broken invariant in the watcher is reported to the caller
 * instead of terminating the application that embeds the library.
 */

#include <stdexcept>
#include <string>

#ifndef LW_ASSERT_THROW_MSG
/// Raise lw::assertion_error if @a P is false, @a M is appended to the message.
#define LW_ASSERT_THROW_MSG(P, M)                                                                                      \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      lw::raise_assertion_error(#P, __func__, __FILE__, __LINE__, M);                                                  \
    }                                                                                                                  \
  } while (false)
#endif // LW_ASSERT_THROW_MSG

#ifndef LW_ASSERT_THROW
#define LW_ASSERT_THROW(P) LW_ASSERT_THROW_MSG(P, "")
#endif // LW_ASSERT_THROW

namespace lw {

/// An internal invariant of the library does not hold.
class assertion_error : public std::runtime_error {
public:
  explicit assertion_error(std::string const& what)
      : std::runtime_error(what) {
  }
};

/**
 * Build the message and throw, the macros call this out-of-line to keep the checks small.
 *
 * @param predicate the text of the failed predicate.
 * @param detail appended to the message, ignored if empty.
 */
[[noreturn]] void raise_assertion_error(
    char const* predicate, char const* function, char const* filename, int lineno, std::string const& detail);

} // namespace lw

#endif // lw_assert_throw_hpp
