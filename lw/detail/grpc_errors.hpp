#ifndef lw_detail_grpc_errors_hpp
#define lw_detail_grpc_errors_hpp
/**
 * @file
 *
 * Report the errors returned by etcd, in log lines and exceptions.
 */

#include <lw/detail/append_annotations.hpp>
#include <lw/etcd_error.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>

#include <iosfwd>
#include <sstream>
#include <string>

namespace lw {
namespace detail {

/// Return the name of @a code, e.g. "UNAVAILABLE".
char const* grpc_status_code_name(grpc::StatusCode code);

/// Format @a status as "grpc error: <message> [<code name>]".
std::string format_grpc_error(grpc::Status const& status);

/**
 * Throw lw::etcd_error if @a status is not OK.
 *
 * @param where names the failed operation, it starts the message.
 * @param a streamed at the end of the message, print_to_stream() adds the request.
 */
template <typename Location, typename... Annotations>
void check_grpc_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " " << format_grpc_error(status);
  append_annotations(os, std::forward<Annotations>(a)...);
  throw etcd_error(os.str(), status.error_code());
}

/**
 * Stream a protobuf message in text format.
 *
 * @code
 * LW_LOG(debug) << "unexpected watch response " << print_to_stream(response);
 * @endcode
 */
class print_to_stream {
public:
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg_(m) {
  }

  friend std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

private:
  google::protobuf::Message const& msg_;
};

} // namespace detail
} // namespace lw

#endif // lw_detail_grpc_errors_hpp
