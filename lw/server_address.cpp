//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
#include "lw/server_address.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace {
[[noreturn]] void raise_malformed(std::string const& text, char const* reason) {
  std::ostringstream os;
  os << "malformed server address <" << text << ">: " << reason;
  throw lw::malformed_address(os.str());
}

/// Characters allowed in host names, IPv4 addresses and unbracketed IPv6 addresses.
bool is_host_char(char c) {
  return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or c == '-' or c == '.'
      or c == '_' or c == ':';
}

/// Characters allowed inside brackets, an IPv6 address with an optional zone id (fe80::1%eth0).
bool is_bracketed_host_char(char c) {
  return is_host_char(c) or c == '%';
}
} // anonymous namespace

namespace lw {

server_address::server_address(std::string host, std::uint16_t port)
    : host_(std::move(host))
    , port_(port) {
  if (host_.empty()) {
    throw std::invalid_argument("server_address() - empty host");
  }
}

server_address server_address::parse(std::string const& text) {
  auto colon = text.rfind(':');
  if (colon == std::string::npos) {
    raise_malformed(text, "not a host:port pair");
  }
  std::string host = text.substr(0, colon);
  bool bracketed = false;
  if (host.size() >= 2 and host.front() == '[' and host.back() == ']') {
    host = host.substr(1, host.size() - 2);
    bracketed = true;
  }
  if (host.empty()) {
    raise_malformed(text, "empty host");
  }
  // ... this also rejects brackets other than the outer pair, NUL bytes, whitespace and non-ASCII text ...
  for (char c : host) {
    if (not(bracketed ? is_bracketed_host_char(c) : is_host_char(c))) {
      raise_malformed(text, "invalid character in host");
    }
  }

  auto digits = text.substr(colon + 1);
  if (digits.empty()) {
    raise_malformed(text, "empty port");
  }
  // ... std::stoul() accepts leading whitespace, signs and trailing garbage, check the digits ourselves ...
  std::uint32_t port = 0;
  for (char c : digits) {
    if (c < '0' or c > '9') {
      raise_malformed(text, "port is not a decimal number");
    }
    port = 10 * port + (c - '0');
    if (port > 65535) {
      raise_malformed(text, "port out of range");
    }
  }
  return server_address(std::move(host), static_cast<std::uint16_t>(port));
}

std::string server_address::str() const {
  std::ostringstream os;
  os << *this;
  return os.str();
}

std::ostream& operator<<(std::ostream& os, server_address const& x) {
  if (x.host().find(':') != std::string::npos) {
    return os << "[" << x.host() << "]:" << x.port();
  }
  return os << x.host() << ":" << x.port();
}

} // namespace lw
