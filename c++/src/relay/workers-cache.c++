// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "workers-cache.h"

#include <kj/debug.h>

namespace relay {

kj::StringPtr KJ_STRINGIFY(WorkersCacheError error) {
  switch (error) {
    case WorkersCacheError::RECEIVER_DROPPED:
      return "Work receiver has been dropped unexpectedly.";
    case WorkersCacheError::FULL_CHANNEL:
      return "Worker's channel is full.";
    case WorkersCacheError::TASK_JOIN_FAILURE:
      return "Task failed to join.";
    case WorkersCacheError::SHUTDOWN:
      return "The WorkersCache is being shutdown.";
  }
  KJ_UNREACHABLE;
}

// =======================================================================================

WorkerInfo::WorkerInfo(Sender<TransactionBatch> sender, kj::Promise<void> task,
                       CancellationToken cancel)
    : sender(kj::mv(sender)), task(kj::mv(task)), cancel(kj::mv(cancel)) {}

kj::Maybe<WorkersCacheError> WorkerInfo::trySendTransactions(TransactionBatch&& batch) {
  switch (sender.trySend(kj::mv(batch))) {
    case TrySendResult::OK:
      return kj::none;
    case TrySendResult::FULL:
      return WorkersCacheError::FULL_CHANNEL;
    case TrySendResult::CLOSED:
      return WorkersCacheError::RECEIVER_DROPPED;
  }
  KJ_UNREACHABLE;
}

kj::Promise<kj::Maybe<WorkersCacheError>> WorkerInfo::sendTransactions(
    TransactionBatch&& batch) {
  return sender.send(kj::mv(batch)).then([](bool delivered) -> kj::Maybe<WorkersCacheError> {
    if (delivered) return kj::none;
    return WorkersCacheError::RECEIVER_DROPPED;
  });
}

kj::Promise<kj::Maybe<WorkersCacheError>> WorkerInfo::shutdown() && {
  cancel.cancel();
  {
    // Dropping the last sender closes the channel, which ends the worker's receive loop.
    auto closed = kj::mv(sender);
  }
  return kj::mv(task).then(
      []() -> kj::Maybe<WorkersCacheError> { return kj::none; },
      [](kj::Exception&& exception) -> kj::Maybe<WorkersCacheError> {
        KJ_LOG(INFO, "worker task failed", exception);
        return WorkersCacheError::TASK_JOIN_FAILURE;
      });
}

ShutdownWorker::ShutdownWorker(PeerAddress leader, WorkerInfo worker)
    : leader(kj::mv(leader)), worker(kj::mv(worker)) {}

kj::Promise<kj::Maybe<WorkersCacheError>> ShutdownWorker::shutdown() && {
  return kj::mv(worker).shutdown();
}

// =======================================================================================

ShutdownTasks::ShutdownTasks(): tasks(*this) {}

void ShutdownTasks::add(kj::Promise<void>&& task) {
  tasks.add(kj::mv(task));
}

bool ShutdownTasks::isEmpty() {
  return tasks.isEmpty();
}

kj::Promise<void> ShutdownTasks::onEmpty() {
  if (tasks.isEmpty()) return kj::READY_NOW;

  // TaskSet allows only one onEmpty() at a time, so waiters share a single watcher.
  auto paf = kj::newPromiseAndFulfiller<void>();
  emptyWaiters.add(kj::mv(paf.fulfiller));
  if (!watching) {
    watching = true;
    watcher = tasks.onEmpty().then([this]() {
      watching = false;
      auto waiters = kj::mv(emptyWaiters);
      for (auto& waiter: waiters) {
        waiter->fulfill();
      }
    }).eagerlyEvaluate(nullptr);
  }
  return kj::mv(paf.promise);
}

void ShutdownTasks::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "detached worker shutdown threw", exception);
}

void maybeShutdownWorker(ShutdownTasks& tasks, kj::Maybe<ShutdownWorker> worker) {
  KJ_IF_SOME(w, worker) {
    auto leader = w.getLeader();
    tasks.add(kj::mv(w).shutdown().then(
        [leader = kj::mv(leader)](kj::Maybe<WorkersCacheError> result) {
      KJ_IF_SOME(error, result) {
        KJ_LOG(INFO, "error while shutting down worker", leader, error);
      }
    }));
  }
}

// =======================================================================================

WorkersCache::WorkersCache(size_t capacity, CancellationToken cancel)
    : workers(capacity), cancel(kj::mv(cancel)) {}

bool WorkersCache::contains(const PeerAddress& peer) const {
  return workers.contains(peer);
}

kj::Maybe<ShutdownWorker> WorkersCache::push(PeerAddress leader, WorkerInfo&& worker) {
  auto evicted = workers.push(kj::mv(leader), kj::mv(worker));
  KJ_IF_SOME(entry, evicted) {
    return ShutdownWorker(kj::mv(entry.first), kj::mv(entry.second));
  }
  return kj::none;
}

kj::Maybe<ShutdownWorker> WorkersCache::pop(const PeerAddress& leader) {
  auto popped = workers.pop(leader);
  KJ_IF_SOME(worker, popped) {
    return ShutdownWorker(leader, kj::mv(worker));
  }
  return kj::none;
}

WorkerInfo& WorkersCache::getWorker(const PeerAddress& peer) {
  return KJ_REQUIRE_NONNULL(workers.get(peer),
      "no worker for peer; check contains() before sending to it", peer);
}

void WorkersCache::pruneWorker(const PeerAddress& peer) {
  KJ_LOG(INFO, "failed to deliver transaction batch, dropping worker", peer);
  maybeShutdownWorker(shutdownTasks, pop(peer));
}

kj::Maybe<WorkersCacheError> WorkersCache::trySendTransactionsToAddress(
    const PeerAddress& peer, TransactionBatch&& batch) {
  if (cancel.isCancelled()) {
    return WorkersCacheError::SHUTDOWN;
  }

  auto result = getWorker(peer).trySendTransactions(kj::mv(batch));
  KJ_IF_SOME(error, result) {
    if (error == WorkersCacheError::RECEIVER_DROPPED) {
      pruneWorker(peer);
    }
  }
  return result;
}

kj::Promise<kj::Maybe<WorkersCacheError>> WorkersCache::sendTransactionsToAddress(
    const PeerAddress& peer, TransactionBatch&& batch) {
  if (cancel.isCancelled()) {
    return kj::Maybe<WorkersCacheError>(WorkersCacheError::SHUTDOWN);
  }

  auto body = getWorker(peer).sendTransactions(kj::mv(batch))
      .then([this, peer = PeerAddress(peer)](kj::Maybe<WorkersCacheError> result) {
    KJ_IF_SOME(error, result) {
      if (error == WorkersCacheError::RECEIVER_DROPPED) {
        // Remove the worker from the cache, the peer has disconnected.
        pruneWorker(peer);
      }
    }
    return result;
  });

  return cancel.runUntilCancelled(kj::mv(body))
      .then([](kj::Maybe<kj::Maybe<WorkersCacheError>> outcome) -> kj::Maybe<WorkersCacheError> {
    KJ_IF_SOME(result, outcome) {
      return result;
    }
    return WorkersCacheError::SHUTDOWN;
  });
}

kj::Promise<void> WorkersCache::shutdown() {
  // Interrupt any outstanding sendTransactionsToAddress() calls.
  cancel.cancel();

  for (;;) {
    auto next = workers.popLru();
    if (next == kj::none) break;
    auto& entry = KJ_ASSERT_NONNULL(next);

    auto result = co_await kj::mv(entry.second).shutdown();
    KJ_IF_SOME(error, result) {
      KJ_LOG(INFO, "error while shutting down worker", entry.first, error);
    }
  }

  co_await shutdownTasks.onEmpty();
}

}  // namespace relay
