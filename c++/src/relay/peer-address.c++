// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "peer-address.h"

#include <kj/debug.h>

namespace relay {

namespace {

uint16_t parsePort(kj::StringPtr digits, kj::StringPtr text) {
  KJ_REQUIRE(digits.size() > 0 && digits.size() <= 5, "invalid port in peer address", text);
  uint32_t port = 0;
  for (char c: digits) {
    KJ_REQUIRE(c >= '0' && c <= '9', "invalid port in peer address", text);
    port = port * 10 + static_cast<uint32_t>(c - '0');
  }
  KJ_REQUIRE(port <= 65535, "port out of range in peer address", text);
  return static_cast<uint16_t>(port);
}

}  // namespace

PeerAddress::PeerAddress(std::string host, uint16_t port): host(kj::mv(host)), port(port) {}

PeerAddress PeerAddress::parse(kj::StringPtr text) {
  if (text.startsWith("[")) {
    KJ_IF_SOME(close, text.findFirst(']')) {
      KJ_REQUIRE(close > 1, "empty host in peer address", text);
      KJ_REQUIRE(close + 1 < text.size() && text[close + 1] == ':',
                 "expected ':' after bracketed host in peer address", text);
      return PeerAddress(std::string(text.begin() + 1, close - 1),
                         parsePort(text.slice(close + 2), text));
    }
    KJ_FAIL_REQUIRE("unterminated '[' in peer address", text);
  }

  KJ_IF_SOME(colon, text.findLast(':')) {
    KJ_REQUIRE(colon > 0, "empty host in peer address", text);
    KJ_IF_SOME(firstColon, text.findFirst(':')) {
      KJ_REQUIRE(firstColon == colon, "IPv6 peer addresses must be bracketed", text);
    }
    return PeerAddress(std::string(text.begin(), colon), parsePort(text.slice(colon + 1), text));
  }
  KJ_FAIL_REQUIRE("peer address must have the form host:port", text);
}

kj::String PeerAddress::toString() const {
  if (host.find(':') != std::string::npos) {
    return kj::str('[', host.c_str(), "]:", port);
  }
  return kj::str(host.c_str(), ':', port);
}

kj::String KJ_STRINGIFY(const PeerAddress& address) {
  return address.toString();
}

}  // namespace relay
