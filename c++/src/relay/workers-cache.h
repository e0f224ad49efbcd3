// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "cancellation.h"
#include "channel.h"
#include "lru-cache.h"
#include "peer-address.h"
#include "transaction-batch.h"

#include <kj/async.h>
#include <kj/vector.h>

#include <cstdint>

namespace relay {

enum class WorkersCacheError: uint8_t {
  RECEIVER_DROPPED,
  // The worker's receiving end is gone, typically because it could not establish its
  // connection or has exited.

  FULL_CHANNEL,
  // The worker's channel is saturated. Transient; the entry stays in the cache.

  TASK_JOIN_FAILURE,
  // The worker task ended with an exception while being shut down.

  SHUTDOWN
  // The cache is shutting down.
};

kj::StringPtr KJ_STRINGIFY(WorkersCacheError error);

class WorkerInfo {
  // Handle to one live outbound worker: the sending end of its channel, the task driving it, and
  // a cancellation token scoped to that worker alone. Can be moved but never copied. Dropping it
  // without calling shutdown() cancels the task outright.

public:
  WorkerInfo(Sender<TransactionBatch> sender, kj::Promise<void> task, CancellationToken cancel);

  WorkerInfo(WorkerInfo&&) = default;
  WorkerInfo& operator=(WorkerInfo&&) = default;
  KJ_DISALLOW_COPY(WorkerInfo);

  kj::Maybe<WorkersCacheError> trySendTransactions(TransactionBatch&& batch);
  // Never suspends. Returns FULL_CHANNEL or RECEIVER_DROPPED on failure.

  kj::Promise<kj::Maybe<WorkersCacheError>> sendTransactions(TransactionBatch&& batch);
  // Waits as long as it takes for channel capacity. Only fails with RECEIVER_DROPPED.

  kj::Promise<kj::Maybe<WorkersCacheError>> shutdown() &&;
  // Cancels the worker's token, closes the channel by dropping the sender, then waits for the
  // task. Fails with TASK_JOIN_FAILURE if the task threw.

private:
  Sender<TransactionBatch> sender;
  kj::Promise<void> task;
  CancellationToken cancel;
};

class ShutdownWorker {
  // A worker that has left the cache and is waiting to be retired. Run shutdown() from a
  // separate task (see maybeShutdownWorker()) to hide the latency of finishing the worker
  // gracefully.

public:
  ShutdownWorker(PeerAddress leader, WorkerInfo worker);

  ShutdownWorker(ShutdownWorker&&) = default;
  ShutdownWorker& operator=(ShutdownWorker&&) = default;
  KJ_DISALLOW_COPY(ShutdownWorker);

  const PeerAddress& getLeader() const { return leader; }

  kj::Promise<kj::Maybe<WorkersCacheError>> shutdown() &&;

private:
  PeerAddress leader;
  WorkerInfo worker;
};

class ShutdownTasks final: private kj::TaskSet::ErrorHandler {
  // Tracks detached worker shutdowns so their owner can wait for stragglers.

public:
  ShutdownTasks();

  void add(kj::Promise<void>&& task);
  bool isEmpty();

  kj::Promise<void> onEmpty();
  // Resolves once no shutdown is in flight. Any number of callers may wait at the same time.

private:
  kj::TaskSet tasks;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> emptyWaiters;
  kj::Promise<void> watcher = kj::READY_NOW;
  bool watching = false;

  void taskFailed(kj::Exception&& exception) override;
};

void maybeShutdownWorker(ShutdownTasks& tasks, kj::Maybe<ShutdownWorker> worker);
// If `worker` is present, shuts it down in a new task tracked by `tasks` and logs the outcome.
// Does nothing otherwise.

class WorkersCache {
  // Bounded LRU map from destination to worker, with a cache-wide cancellation token.
  //
  // The cache is not internally synchronized. Callers serialize mutating calls and must not push
  // or pop entries while a sendTransactionsToAddress() promise on this cache is outstanding. The
  // cache must outlive every promise it returns.

public:
  WorkersCache(size_t capacity, CancellationToken cancel);
  KJ_DISALLOW_COPY_AND_MOVE(WorkersCache);

  size_t size() const { return workers.size(); }
  size_t capacity() const { return workers.capacity(); }

  bool contains(const PeerAddress& peer) const;
  // Does not affect recency.

  kj::Maybe<ShutdownWorker> push(PeerAddress leader, WorkerInfo&& worker);
  // Inserts `worker` as the most recently used entry. Returns the entry that had to make room: the
  // previous worker for `leader` if there was one, or else the least recently used entry if the
  // cache was full. Hand the result to maybeShutdownWorker().

  kj::Maybe<ShutdownWorker> pop(const PeerAddress& leader);

  kj::Maybe<WorkersCacheError> trySendTransactionsToAddress(
      const PeerAddress& peer, TransactionBatch&& batch);
  // Attempts to deliver `batch` immediately. Fails with SHUTDOWN once shutdown() has been called,
  // FULL_CHANNEL if the worker's channel is saturated, or RECEIVER_DROPPED if the worker has
  // stopped, in which case the worker is also removed and retired in the background.
  //
  // Unless the cache is shutting down, `peer` must be present; check with contains() first.

  kj::Promise<kj::Maybe<WorkersCacheError>> sendTransactionsToAddress(
      const PeerAddress& peer, TransactionBatch&& batch);
  // Like trySendTransactionsToAddress() but waits for channel capacity, so FULL_CHANNEL is never
  // returned. Resolves to SHUTDOWN if shutdown() is called before the send completes.

  kj::Promise<void> shutdown();
  // Interrupts outstanding sends, then shuts every worker down in least recently used order, then
  // waits for background shutdowns started by this cache. Worker failures are logged and do not
  // stop the drain. May be called again, including while an earlier call is still pending.

  ShutdownTasks& getShutdownTasks() { return shutdownTasks; }

private:
  LruCache<PeerAddress, WorkerInfo> workers;
  CancellationToken cancel;
  ShutdownTasks shutdownTasks;

  WorkerInfo& getWorker(const PeerAddress& peer);
  void pruneWorker(const PeerAddress& peer);
};

}  // namespace relay
