// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "bench.h"
#include "workers-cache.h"

#include <capnp/serialize-async.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/vector.h>

#include <memory>

namespace relay {

namespace {

struct SinkCounters {
  uint64_t messages = 0;
  uint64_t transactions = 0;
};

kj::Promise<void> runSink(kj::Own<kj::AsyncIoStream> stream,
                          std::shared_ptr<SinkCounters> counters) {
  auto connection = kj::mv(stream);
  for (;;) {
    auto message = co_await capnp::tryReadMessage(*connection);
    if (message == kj::none) co_return;
    auto& reader = KJ_ASSERT_NONNULL(message);
    auto batch = TransactionBatch::decode(*reader);
    ++counters->messages;
    counters->transactions += batch.size();
  }
}

TransactionBatch makeBatch(uint sequence, uint batchSize) {
  auto builder = kj::heapArrayBuilder<kj::Array<kj::byte>>(batchSize);
  for (uint i = 0; i < batchSize; i++) {
    auto transaction = kj::heapArray<kj::byte>(64);
    for (auto& byte: transaction) {
      byte = static_cast<kj::byte>(sequence + i);
    }
    builder.add(kj::mv(transaction));
  }
  return TransactionBatch(builder.finish());
}

}  // namespace

kj::String KJ_STRINGIFY(const BenchReport& report) {
  kj::Vector<kj::String> lines;
  lines.add(kj::str("sent: ", report.sent, "  full: ", report.full,
                    "  dropped: ", report.dropped, "  shutdown: ", report.shutdown,
                    "  evicted: ", report.evicted));
  lines.add(kj::str("written: ", report.written.batchesSent, " batches, ",
                    report.written.transactionsSent, " transactions, ",
                    report.written.writeFailures, " write failures"));
  for (auto& tally: report.peers) {
    lines.add(kj::str(tally.peer, ": ", tally.batches, " batches, ",
                      tally.transactions, " transactions"));
  }
  return kj::strArray(lines, "\n");
}

BenchReport runBench(const BenchConfig& config, kj::WaitScope& waitScope) {
  KJ_REQUIRE(config.peers > 0, "need at least one peer");

  CancellationToken cancel;
  WorkersCache cache(config.capacity, cancel);
  auto stats = std::make_shared<WorkerStats>();
  BenchReport report;

  kj::Vector<PeerAddress> peers(config.peers);
  kj::Vector<std::shared_ptr<SinkCounters>> received(config.peers);
  for (uint i = 0; i < config.peers; i++) {
    peers.add(PeerAddress::parse(kj::str("10.0.", i / 250, ".", i % 250 + 1, ":8009")));
    received.add(std::make_shared<SinkCounters>());
  }

  kj::Vector<kj::Promise<void>> sinks;

  for (uint i = 0; i < config.batches; i++) {
    auto index = i % config.peers;
    auto& peer = peers[index];

    if (!cache.contains(peer)) {
      auto pipe = kj::newTwoWayPipe();
      // An evicted worker can be cancelled halfway through a message.
      sinks.add(runSink(kj::mv(pipe.ends[1]), received[index])
          .eagerlyEvaluate([peer = PeerAddress(peer)](kj::Exception&& exception) {
        KJ_LOG(INFO, "sink stopped early", peer, exception);
      }));
      auto worker = spawnStreamWorker(kj::mv(pipe.ends[0]), config.channelSize,
                                      cancel.childToken(), stats);
      auto evicted = cache.push(peer, kj::mv(worker));
      if (evicted != kj::none) ++report.evicted;
      maybeShutdownWorker(cache.getShutdownTasks(), kj::mv(evicted));
    }

    kj::Maybe<WorkersCacheError> result;
    if (config.backpressure) {
      result = cache.sendTransactionsToAddress(peer, makeBatch(i, config.batchSize))
          .wait(waitScope);
    } else {
      result = cache.trySendTransactionsToAddress(peer, makeBatch(i, config.batchSize));
      waitScope.poll();
    }

    if (result == kj::none) {
      ++report.sent;
      continue;
    }
    switch (KJ_ASSERT_NONNULL(result)) {
      case WorkersCacheError::FULL_CHANNEL:
        ++report.full;
        break;
      case WorkersCacheError::RECEIVER_DROPPED:
        ++report.dropped;
        break;
      case WorkersCacheError::SHUTDOWN:
        ++report.shutdown;
        break;
      case WorkersCacheError::TASK_JOIN_FAILURE:
        KJ_UNREACHABLE;
    }
  }

  cache.shutdown().wait(waitScope);
  kj::joinPromises(sinks.releaseAsArray()).wait(waitScope);

  report.written = *stats;
  auto tallies = kj::heapArrayBuilder<BenchReport::PeerTally>(peers.size());
  for (auto i: kj::indices(peers)) {
    tallies.add(BenchReport::PeerTally {
        peers[i], received[i]->messages, received[i]->transactions });
  }
  report.peers = tallies.finish();
  return report;
}

}  // namespace relay
