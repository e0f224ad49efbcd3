// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "worker.h"

namespace relay {

WorkerInfo spawnWorker(size_t channelSize, CancellationToken cancel, WorkerBody body) {
  auto channel = newChannel<TransactionBatch>(channelSize);

  // The body is attached to its task and lives as long as the task does.
  auto task = kj::evalNow([&]() {
    return body(kj::mv(channel.receiver), cancel);
  }).attach(kj::mv(body)).eagerlyEvaluate(nullptr);

  return WorkerInfo(kj::mv(channel.sender), kj::mv(task), kj::mv(cancel));
}

}  // namespace relay
