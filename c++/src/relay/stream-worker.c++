// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "stream-worker.h"

#include <capnp/message.h>
#include <capnp/serialize-async.h>
#include <kj/debug.h>

namespace relay {

kj::Promise<void> runStreamWorker(kj::Own<kj::AsyncIoStream> stream,
                                  Receiver<TransactionBatch> receiver,
                                  CancellationToken cancel,
                                  std::shared_ptr<WorkerStats> stats,
                                  uint32_t maxWriteFailures) {
  auto connection = kj::mv(stream);
  auto batches = kj::mv(receiver);
  uint32_t consecutiveFailures = 0;

  for (;;) {
    auto next = co_await cancel.runUntilCancelled(batches.receive());
    if (next == kj::none) break;
    auto& received = KJ_ASSERT_NONNULL(next);
    if (received == kj::none) break;
    auto& batch = KJ_ASSERT_NONNULL(received);

    capnp::MallocMessageBuilder message;
    batch.encode(message);
    auto written = co_await cancel.runUntilCancelled(
        kj::evalNow([&]() { return capnp::writeMessage(*connection, message); }).then(
            []() -> kj::Maybe<kj::Exception> { return kj::none; },
            [](kj::Exception&& exception) -> kj::Maybe<kj::Exception> {
              return kj::mv(exception);
            }));
    if (written == kj::none) break;

    auto& failure = KJ_ASSERT_NONNULL(written);
    KJ_IF_SOME(exception, failure) {
      ++stats->writeFailures;
      ++consecutiveFailures;
      KJ_LOG(WARNING, "failed to write transaction batch", consecutiveFailures, exception);
      if (consecutiveFailures >= maxWriteFailures) {
        KJ_LOG(WARNING, "giving up on stream after repeated write failures");
        break;
      }
      continue;
    }

    consecutiveFailures = 0;
    ++stats->batchesSent;
    stats->transactionsSent += batch.size();
  }

  auto shutdownError = kj::runCatchingExceptions([&]() { connection->shutdownWrite(); });
  KJ_IF_SOME(exception, shutdownError) {
    KJ_LOG(INFO, "could not shut down stream", exception);
  }
}

WorkerInfo spawnStreamWorker(kj::Own<kj::AsyncIoStream> stream, size_t channelSize,
                             CancellationToken cancel, std::shared_ptr<WorkerStats> stats,
                             uint32_t maxWriteFailures) {
  KJ_REQUIRE(maxWriteFailures > 0, "a stream worker must tolerate at least one write failure");
  return spawnWorker(channelSize, kj::mv(cancel),
      [stream = kj::mv(stream), stats = kj::mv(stats), maxWriteFailures](
          Receiver<TransactionBatch> receiver, CancellationToken cancel) mutable {
    return runStreamWorker(kj::mv(stream), kj::mv(receiver), kj::mv(cancel), kj::mv(stats),
                           maxWriteFailures);
  });
}

}  // namespace relay
