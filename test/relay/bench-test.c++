// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <relay/bench.h>

#include "test-util.h"

#include <gtest/gtest.h>

namespace relay {
namespace {

class BenchTest: public ::testing::Test {
protected:
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
};

TEST_F(BenchTest, DeliversEveryBatchWhenAllPeersFit) {
  BenchConfig config;
  config.capacity = 4;
  config.peers = 4;
  config.batches = 12;
  config.batchSize = 3;

  auto report = runBench(config, waitScope);
  EXPECT_EQ(report.sent, 12u);
  EXPECT_EQ(report.full + report.dropped + report.shutdown, 0u);
  EXPECT_EQ(report.evicted, 0u);
  EXPECT_EQ(report.written.batchesSent, 12u);
  EXPECT_EQ(report.written.transactionsSent, 36u);
  EXPECT_EQ(report.written.writeFailures, 0u);

  ASSERT_EQ(report.peers.size(), 4u);
  EXPECT_EQ(report.peers[0].peer, PeerAddress::parse("10.0.0.1:8009"));
  for (auto& tally: report.peers) {
    EXPECT_EQ(tally.batches, 3u);
    EXPECT_EQ(tally.transactions, 9u);
  }
}

TEST_F(BenchTest, BackpressureDeliversEveryBatch) {
  BenchConfig config;
  config.capacity = 2;
  config.channelSize = 1;
  config.peers = 2;
  config.batches = 10;
  config.batchSize = 1;
  config.backpressure = true;

  auto report = runBench(config, waitScope);
  EXPECT_EQ(report.sent, 10u);
  EXPECT_EQ(report.full, 0u);
  EXPECT_EQ(report.written.batchesSent, 10u);
  EXPECT_EQ(report.peers[0].batches + report.peers[1].batches, 10u);
}

TEST_F(BenchTest, CountsEvictionsWhenPeersOutnumberCapacity) {
  BenchConfig config;
  config.capacity = 1;
  config.peers = 3;
  config.batches = 6;
  config.batchSize = 1;

  auto report = runBench(config, waitScope);
  EXPECT_EQ(report.evicted, 5u);
  EXPECT_EQ(report.sent + report.full + report.dropped + report.shutdown, 6u);
  EXPECT_EQ(report.shutdown, 0u);

  uint64_t decoded = 0;
  for (auto& tally: report.peers) decoded += tally.batches;
  EXPECT_EQ(decoded, report.written.batchesSent);
  EXPECT_LE(report.written.batchesSent, report.sent);
}

TEST_F(BenchTest, ReportListsCountersAndPeers) {
  BenchConfig config;
  config.capacity = 1;
  config.peers = 1;
  config.batches = 2;
  config.batchSize = 2;

  auto text = kj::str(runBench(config, waitScope));
  EXPECT_TRUE(text.startsWith("sent: 2  full: 0  dropped: 0  shutdown: 0  evicted: 0\n"))
      << text.cStr();
  EXPECT_TRUE(text.endsWith("10.0.0.1:8009: 2 batches, 4 transactions")) << text.cStr();
}

TEST_F(BenchTest, RequiresAPeer) {
  BenchConfig config;
  config.peers = 0;
  EXPECT_TRUE(test::throwsWithMessage("need at least one peer", [&]() {
    runBench(config, waitScope);
  }));
}

}  // namespace
}  // namespace relay
