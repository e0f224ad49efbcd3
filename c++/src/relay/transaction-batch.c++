// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "transaction-batch.h"

#include <relay/transaction-batch.capnp.h>
#include <kj/time.h>

namespace relay {

namespace {

uint64_t nowNanos() {
  return (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::NANOSECONDS;
}

}  // namespace

TransactionBatch::TransactionBatch(kj::Array<kj::Array<kj::byte>> transactions)
    : transactions(kj::mv(transactions)), timestamp(nowNanos()) {}

TransactionBatch::TransactionBatch(kj::Array<kj::Array<kj::byte>> transactions,
                                   uint64_t timestamp)
    : transactions(kj::mv(transactions)), timestamp(timestamp) {}

void TransactionBatch::encode(capnp::MessageBuilder& message) const {
  auto root = message.initRoot<wire::TransactionBatch>();
  root.setTimestamp(timestamp);
  auto list = root.initTransactions(transactions.size());
  for (auto i: kj::indices(transactions)) {
    list.set(i, transactions[i].asPtr());
  }
}

TransactionBatch TransactionBatch::decode(capnp::MessageReader& message) {
  auto root = message.getRoot<wire::TransactionBatch>();
  auto list = root.getTransactions();
  auto builder = kj::heapArrayBuilder<kj::Array<kj::byte>>(list.size());
  for (auto data: list) {
    builder.add(kj::heapArray<kj::byte>(data));
  }
  return TransactionBatch(builder.finish(), root.getTimestamp());
}

}  // namespace relay
