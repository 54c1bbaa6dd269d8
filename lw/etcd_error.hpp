#ifndef lw_etcd_error_hpp
#define lw_etcd_error_hpp

#include <grpc++/grpc++.h>

#include <stdexcept>
#include <string>

namespace lw {

/**
 * An etcd request failed.
 *
 * Raised by lw::node_watcher::startup() when the initial read of the key fails, the watch reconnects on its own after
 * that.  UNAVAILABLE and DEADLINE_EXCEEDED usually mean the cluster is unreachable, other codes point to a
 * configuration problem.
 */
class etcd_error : public std::runtime_error {
public:
  etcd_error(std::string const& what, grpc::StatusCode code)
      : std::runtime_error(what)
      , code_(code) {
  }

  grpc::StatusCode code() const {
    return code_;
  }

private:
  grpc::StatusCode code_;
};

} // namespace lw

#endif // lw_etcd_error_hpp
