// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "bench.h"

#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/main.h>

#ifndef VERSION
#define VERSION "(unknown)"
#endif

namespace relay {
namespace {

kj::MainBuilder::Validity parsePositive(kj::StringPtr arg, uint& out) {
  auto parsed = arg.tryParseAs<uint>();
  KJ_IF_SOME(value, parsed) {
    if (value > 0) {
      out = value;
      return true;
    }
  }
  return kj::str("expected a positive integer, got: ", arg);
}

class RelayBenchMain {
public:
  RelayBenchMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "relay-bench version " VERSION,
          "Sends synthetic transaction batches round-robin to a set of in-process peers through "
          "a bounded cache of outbound workers, then prints how many were delivered, refused "
          "or lost to evictions.")
        .addOptionWithArg({'c', "capacity"}, KJ_BIND_METHOD(*this, setCapacity), "<count>",
            "Keep at most <count> workers alive. Default: 8.")
        .addOptionWithArg({"channel-size"}, KJ_BIND_METHOD(*this, setChannelSize), "<count>",
            "Buffer up to <count> batches per worker. Default: 4.")
        .addOptionWithArg({'p', "peers"}, KJ_BIND_METHOD(*this, setPeers), "<count>",
            "Send to <count> distinct peers. Default: 16.")
        .addOptionWithArg({'n', "batches"}, KJ_BIND_METHOD(*this, setBatches), "<count>",
            "Send <count> batches in total. Default: 1000.")
        .addOptionWithArg({"batch-size"}, KJ_BIND_METHOD(*this, setBatchSize), "<count>",
            "Put <count> transactions in each batch. Default: 8.")
        .addOption({"backpressure"}, KJ_BIND_METHOD(*this, enableBackpressure),
            "Wait for channel space instead of dropping batches for saturated workers.")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, enableVerbose),
            "Log worker lifecycle events.")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

  kj::MainBuilder::Validity setCapacity(kj::StringPtr arg) {
    return parsePositive(arg, config.capacity);
  }
  kj::MainBuilder::Validity setChannelSize(kj::StringPtr arg) {
    return parsePositive(arg, config.channelSize);
  }
  kj::MainBuilder::Validity setPeers(kj::StringPtr arg) {
    return parsePositive(arg, config.peers);
  }
  kj::MainBuilder::Validity setBatches(kj::StringPtr arg) {
    return parsePositive(arg, config.batches);
  }
  kj::MainBuilder::Validity setBatchSize(kj::StringPtr arg) {
    return parsePositive(arg, config.batchSize);
  }

  kj::MainBuilder::Validity enableBackpressure() {
    config.backpressure = true;
    return true;
  }

  kj::MainBuilder::Validity enableVerbose() {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  kj::MainBuilder::Validity run() {
    auto io = kj::setupAsyncIo();
    auto report = runBench(config, io.waitScope);
    context.exitInfo(kj::str(report));
    KJ_UNREACHABLE;
  }

private:
  kj::ProcessContext& context;
  BenchConfig config;
};

}  // namespace
}  // namespace relay

KJ_MAIN(relay::RelayBenchMain);
