#include "lw/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>

#include <ostream>

namespace {
char const* const status_code_names[] = {
    "OK",
    "CANCELLED",
    "UNKNOWN",
    "INVALID_ARGUMENT",
    "DEADLINE_EXCEEDED",
    "NOT_FOUND",
    "ALREADY_EXISTS",
    "PERMISSION_DENIED",
    "RESOURCE_EXHAUSTED",
    "FAILED_PRECONDITION",
    "ABORTED",
    "OUT_OF_RANGE",
    "UNIMPLEMENTED",
    "INTERNAL",
    "UNAVAILABLE",
    "DATA_LOSS",
    "UNAUTHENTICATED",
};
} // anonymous namespace

namespace lw {
namespace detail {

char const* grpc_status_code_name(grpc::StatusCode code) {
  auto index = static_cast<std::size_t>(code);
  if (index >= sizeof(status_code_names) / sizeof(status_code_names[0])) {
    return "UNKNOWN_STATUS_CODE";
  }
  return status_code_names[index];
}

std::string format_grpc_error(grpc::Status const& status) {
  std::ostringstream os;
  os << "grpc error: " << status.error_message() << " [" << grpc_status_code_name(status.error_code()) << "]";
  return os.str();
}

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // ... an empty string if printing fails, good enough for a log line ...
  std::string formatted;
  (void)google::protobuf::TextFormat::PrintToString(x.msg_, &formatted);
  return os << formatted;
}

} // namespace detail
} // namespace lw
