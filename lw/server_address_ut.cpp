#include "lw/server_address.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

/**
 * @test Verify that well-formed addresses are decoded.
 */
TEST(server_address, parse_basic) {
  auto a = lw::server_address::parse("10.0.0.5:60000");
  EXPECT_EQ(a.host(), "10.0.0.5");
  EXPECT_EQ(a.port(), 60000);

  auto b = lw::server_address::parse("master.example.com:1");
  EXPECT_EQ(b.host(), "master.example.com");
  EXPECT_EQ(b.port(), 1);

  auto c = lw::server_address::parse("a:0");
  EXPECT_EQ(c.host(), "a");
  EXPECT_EQ(c.port(), 0);

  auto d = lw::server_address::parse("h:65535");
  EXPECT_EQ(d.port(), 65535);
}

/**
 * @test Verify that IPv6 addresses are split at the last colon and brackets are removed.
 */
TEST(server_address, parse_ipv6) {
  auto a = lw::server_address::parse("[::1]:2379");
  EXPECT_EQ(a.host(), "::1");
  EXPECT_EQ(a.port(), 2379);
  EXPECT_EQ(a.str(), "[::1]:2379");

  auto b = lw::server_address::parse("fe80::1:80");
  EXPECT_EQ(b.host(), "fe80::1");
  EXPECT_EQ(b.port(), 80);

  auto c = lw::server_address::parse("[fe80::1%eth0]:2380");
  EXPECT_EQ(c.host(), "fe80::1%eth0");
  EXPECT_EQ(c.str(), "[fe80::1%eth0]:2380");

  auto d = lw::server_address::parse("etcd_0.cluster-a:2379");
  EXPECT_EQ(d.host(), "etcd_0.cluster-a");
}

/**
 * @test Verify that malformed values raise lw::malformed_address, never a partial result.
 */
TEST(server_address, parse_malformed) {
  EXPECT_THROW(lw::server_address::parse("not-an-address"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse(""), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse(":60000"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("[]:60000"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:http"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:-1"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:+80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host: 80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:80x"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:65536"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host:99999999999999999999"), lw::malformed_address);

  // ... the host must be a host name or an address literal ...
  EXPECT_THROW(lw::server_address::parse("\xff\xfe:80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse(std::string("a\0b:80", 6)), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("not an address:1"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("host\t:1"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("[::1]x:80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("[::1:80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("::1]:80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("[[::1]]:80"), lw::malformed_address);
  EXPECT_THROW(lw::server_address::parse("[host]%:80"), lw::malformed_address);

  // ... the exception is also a std::invalid_argument ...
  EXPECT_THROW(lw::server_address::parse("garbage"), std::invalid_argument);
}

/**
 * @test Verify the comparison and streaming operators.
 */
TEST(server_address, compare_and_stream) {
  lw::server_address a("b", 2);
  lw::server_address b("b", 2);
  lw::server_address c("a", 1);
  lw::server_address d("b", 3);

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_NE(a, d);
  EXPECT_LT(c, a);
  EXPECT_LT(a, d);
  EXPECT_FALSE(a < b);

  std::ostringstream os;
  os << a << " " << lw::server_address("10.0.0.5", 60000);
  EXPECT_EQ(os.str(), "b:2 10.0.0.5:60000");
  EXPECT_EQ(lw::server_address::parse(a.str()), a);

  EXPECT_THROW(lw::server_address("", 80), std::invalid_argument);
}
