// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/string.h>

#include <cstdint>
#include <functional>
#include <string>

namespace relay {

struct PeerAddress {
  // Destination of a worker: a host (name or IP literal) and a port.

  std::string host;
  uint16_t port = 0;

  PeerAddress() = default;
  PeerAddress(std::string host, uint16_t port);

  static PeerAddress parse(kj::StringPtr text);
  // Accepts "host:port" and "[ipv6]:port". Malformed input fails a precondition.

  kj::String toString() const;

  bool operator==(const PeerAddress& other) const {
    return port == other.port && host == other.host;
  }
  bool operator!=(const PeerAddress& other) const { return !(*this == other); }
};

kj::String KJ_STRINGIFY(const PeerAddress& address);

}  // namespace relay

namespace std {

template <>
struct hash<relay::PeerAddress> {
  size_t operator()(const relay::PeerAddress& address) const {
    return std::hash<std::string>()(address.host) * 31 + address.port;
  }
};

}  // namespace std
