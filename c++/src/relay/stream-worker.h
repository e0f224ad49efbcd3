// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "worker.h"

#include <kj/async-io.h>

#include <cstdint>
#include <memory>

namespace relay {

struct WorkerStats {
  uint64_t batchesSent = 0;
  uint64_t transactionsSent = 0;
  uint64_t writeFailures = 0;
};

kj::Promise<void> runStreamWorker(kj::Own<kj::AsyncIoStream> stream,
                                  Receiver<TransactionBatch> receiver,
                                  CancellationToken cancel,
                                  std::shared_ptr<WorkerStats> stats,
                                  uint32_t maxWriteFailures);
// Writes every received batch to `stream` as one Cap'n Proto message, until the channel is
// closed and drained or `cancel` fires. After `maxWriteFailures` consecutive failed writes the
// worker gives up and returns, which drops the receiver. Shuts down the write side of the stream
// on the way out.

WorkerInfo spawnStreamWorker(kj::Own<kj::AsyncIoStream> stream, size_t channelSize,
                             CancellationToken cancel, std::shared_ptr<WorkerStats> stats,
                             uint32_t maxWriteFailures = 3);

}  // namespace relay
