// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <capnp/message.h>
#include <kj/array.h>
#include <kj/common.h>

#include <cstdint>

namespace relay {

class TransactionBatch {
  // An immutable group of wire transactions forwarded to one destination as a unit.

public:
  explicit TransactionBatch(kj::Array<kj::Array<kj::byte>> transactions);
  // Stamps the batch with the current time.

  TransactionBatch(kj::Array<kj::Array<kj::byte>> transactions, uint64_t timestamp);

  TransactionBatch(TransactionBatch&&) = default;
  TransactionBatch& operator=(TransactionBatch&&) = default;
  KJ_DISALLOW_COPY(TransactionBatch);

  size_t size() const { return transactions.size(); }
  kj::ArrayPtr<const kj::Array<kj::byte>> getTransactions() const { return transactions; }
  uint64_t getTimestamp() const { return timestamp; }

  void encode(capnp::MessageBuilder& message) const;
  // Initializes the message root as a wire::TransactionBatch.

  static TransactionBatch decode(capnp::MessageReader& message);

private:
  kj::Array<kj::Array<kj::byte>> transactions;
  uint64_t timestamp;
};

}  // namespace relay
