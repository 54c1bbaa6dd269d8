#include "lw/detail/grpc_errors.hpp"
#include <etcdserverpb/rpc.pb.h>

#include <gtest/gtest.h>

/**
 * @test Verify that check_grpc_status() does nothing for successful requests.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  using namespace lw::detail;

  etcdserverpb::RangeRequest req;
  req.set_key("/hbase/master");
  ASSERT_NO_THROW(check_grpc_status(grpc::Status::OK, "startup/range", " request=", print_to_stream(req)));
}

/**
 * @test Verify that check_grpc_status() raises lw::etcd_error with the code and the annotations.
 */
TEST(grpc_errors, check_grpc_status_error) {
  using namespace lw::detail;

  grpc::Status status(grpc::UNAVAILABLE, "connection refused");
  etcdserverpb::RangeRequest req;
  req.set_revision(42);
  try {
    check_grpc_status(status, "startup/range", " request=", print_to_stream(req));
    FAIL() << "check_grpc_status() should have thrown";
  } catch (lw::etcd_error const& ex) {
    EXPECT_EQ(grpc::UNAVAILABLE, ex.code());
    EXPECT_EQ(std::string("startup/range grpc error: connection refused [UNAVAILABLE] request=revision: 42\n"), ex.what());
  }

  // ... callers that do not care about the code catch std::runtime_error ...
  EXPECT_THROW(check_grpc_status(grpc::Status(grpc::UNKNOWN, "bad thing"), "startup/range"), std::runtime_error);
}

/**
 * @test Verify the formatting of gRPC errors in the watcher log lines.
 */
TEST(grpc_errors, format_grpc_error) {
  using namespace lw::detail;

  EXPECT_EQ(
      "grpc error: lease expired [FAILED_PRECONDITION]",
      format_grpc_error(grpc::Status(grpc::FAILED_PRECONDITION, "lease expired")));
  EXPECT_STREQ("OK", grpc_status_code_name(grpc::OK));
  EXPECT_STREQ("UNAUTHENTICATED", grpc_status_code_name(grpc::UNAUTHENTICATED));
  EXPECT_STREQ("UNKNOWN_STATUS_CODE", grpc_status_code_name(static_cast<grpc::StatusCode>(99)));
}

/**
 * @test Verify that print_to_stream prints protobuf messages in text format.
 */
TEST(grpc_errors, print_to_stream) {
  using namespace lw::detail;

  etcdserverpb::RangeRequest req;
  req.set_key("/hbase/master");

  std::ostringstream os;
  os << print_to_stream(req);
  EXPECT_EQ("key: \"/hbase/master\"\n", os.str());
}
