#ifndef lw_server_address_hpp
#define lw_server_address_hpp
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

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace lw {

/**
 * Raised when a value published by the master cannot be decoded as a @c lw::server_address.
 *
 * A malformed value is never treated as "no master", it indicates that the publisher and the reader disagree about
 * the format, or that the value was corrupted.
 */
class malformed_address : public std::invalid_argument {
public:
  explicit malformed_address(std::string const& what)
      : std::invalid_argument(what) {
  }
};

/**
 * The network address of a server, a (host, port) pair.
 *
 * The text representation is "host:port", the host is whatever precedes the last ':' in the text.  IPv6 hosts are
 * written in brackets, e.g. "[::1]:60000", the brackets are not part of the host.
 */
class server_address {
public:
  server_address(std::string host, std::uint16_t port);

  /**
   * Decode a "host:port" string.
   *
   * @throws lw::malformed_address if @a text is not a well-formed "host:port" string, that is, if there is no ':',
   * the host is empty, or the port is not a decimal number in the [0,65535] range.
   */
  static server_address parse(std::string const& text);

  std::string const& host() const {
    return host_;
  }
  std::uint16_t port() const {
    return port_;
  }

  /// The "host:port" representation, parse(x.str()) == x.
  std::string str() const;

  bool operator==(server_address const& rhs) const {
    return port_ == rhs.port_ and host_ == rhs.host_;
  }
  bool operator!=(server_address const& rhs) const {
    return not(*this == rhs);
  }
  bool operator<(server_address const& rhs) const {
    return host_ < rhs.host_ or (host_ == rhs.host_ and port_ < rhs.port_);
  }

private:
  std::string host_;
  std::uint16_t port_;
};

/// Streaming operator, writes the "host:port" representation.
std::ostream& operator<<(std::ostream& os, server_address const& x);

} // namespace lw

#endif // lw_server_address_hpp
