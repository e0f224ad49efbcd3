// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "workers-cache.h"

#include <kj/function.h>

namespace relay {

using WorkerBody =
    kj::Function<kj::Promise<void>(Receiver<TransactionBatch> receiver, CancellationToken cancel)>;
// The loop of an outbound worker. It owns the receiver and must return, without throwing, once
// the channel is closed or `cancel` fires. Coroutine bodies should move the receiver into a local
// so that it is dropped as soon as the body finishes rather than when the task is joined.

WorkerInfo spawnWorker(size_t channelSize, CancellationToken cancel, WorkerBody body);
// Creates a channel holding up to `channelSize` batches, starts `body` on the current event loop,
// and returns the handle owning the sender, the task and `cancel`.

}  // namespace relay
