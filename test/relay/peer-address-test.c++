// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <relay/peer-address.h>

#include "test-util.h"

#include <gtest/gtest.h>

#include <unordered_set>

namespace relay {
namespace {

TEST(PeerAddress, ParsesHostAndPort) {
  auto address = PeerAddress::parse("10.0.0.1:8009");
  EXPECT_EQ(address.host, "10.0.0.1");
  EXPECT_EQ(address.port, 8009);

  auto named = PeerAddress::parse("validator.example.com:443");
  EXPECT_EQ(named.host, "validator.example.com");
  EXPECT_EQ(named.port, 443);
}

TEST(PeerAddress, ParsesBracketedIpv6) {
  auto address = PeerAddress::parse("[::1]:8009");
  EXPECT_EQ(address.host, "::1");
  EXPECT_EQ(address.port, 8009);
  EXPECT_EQ(address.toString(), "[::1]:8009");
}

TEST(PeerAddress, FormatsAsParsed) {
  EXPECT_EQ(PeerAddress("10.0.0.7", 1).toString(), "10.0.0.7:1");
  EXPECT_EQ(kj::str(PeerAddress("2001:db8::2", 65535)), "[2001:db8::2]:65535");
}

TEST(PeerAddress, RejectsMalformedInput) {
  EXPECT_TRUE(test::throwsWithMessage("host:port", []() { PeerAddress::parse("10.0.0.1"); }));
  EXPECT_TRUE(test::throwsWithMessage("empty host", []() { PeerAddress::parse(":80"); }));
  EXPECT_TRUE(test::throwsWithMessage("must be bracketed", []() {
    PeerAddress::parse("::1:80");
  }));
  EXPECT_TRUE(test::throwsWithMessage("invalid port", []() {
    PeerAddress::parse("10.0.0.1:");
  }));
  EXPECT_TRUE(test::throwsWithMessage("invalid port", []() {
    PeerAddress::parse("10.0.0.1:80a");
  }));
  EXPECT_TRUE(test::throwsWithMessage("out of range", []() {
    PeerAddress::parse("10.0.0.1:65536");
  }));
  EXPECT_TRUE(test::throwsWithMessage("unterminated", []() { PeerAddress::parse("[::1:80"); }));
  EXPECT_TRUE(test::throwsWithMessage("expected ':'", []() { PeerAddress::parse("[::1]80"); }));
}

TEST(PeerAddress, HashesByValue) {
  std::unordered_set<PeerAddress> peers;
  peers.insert(PeerAddress::parse("10.0.0.1:8009"));
  peers.insert(PeerAddress("10.0.0.1", 8009));
  peers.insert(PeerAddress("10.0.0.1", 8010));
  EXPECT_EQ(peers.size(), 2u);
  EXPECT_NE(PeerAddress("a", 1), PeerAddress("a", 2));
}

}  // namespace
}  // namespace relay
