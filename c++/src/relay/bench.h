// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "peer-address.h"
#include "stream-worker.h"

#include <kj/array.h>
#include <kj/async.h>
#include <kj/string.h>

#include <cstdint>

namespace relay {

struct BenchConfig {
  uint capacity = 8;
  uint channelSize = 4;
  uint peers = 16;
  uint batches = 1000;
  uint batchSize = 8;

  bool backpressure = false;
  // Wait for channel space instead of dropping batches for saturated workers.
};

struct BenchReport {
  uint64_t sent = 0;
  uint64_t full = 0;
  uint64_t dropped = 0;
  uint64_t shutdown = 0;
  uint64_t evicted = 0;

  WorkerStats written;
  // Totals across every stream worker the run spawned.

  struct PeerTally {
    PeerAddress peer;
    uint64_t batches = 0;
    uint64_t transactions = 0;
  };
  kj::Array<PeerTally> peers;
  // What each peer's end of the pipe actually decoded, in peer order.
};

kj::String KJ_STRINGIFY(const BenchReport& report);

BenchReport runBench(const BenchConfig& config, kj::WaitScope& waitScope);
// Sends `config.batches` synthetic batches round-robin to `config.peers` in-process peers
// through a WorkersCache, spawning a stream worker over an in-memory pipe whenever a peer has
// none. Shuts the cache down and waits for every peer to see end of stream before returning.

}  // namespace relay
