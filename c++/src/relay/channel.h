// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/refcount.h>

#include <deque>

namespace relay {

// Bounded multi-producer, single-consumer queue living on one KJ event loop.
//
// Senders can be cloned; the channel closes once the last one is dropped, at which point the
// receiver drains what is buffered and then sees none. Dropping the receiver discards the buffer
// and makes every send, pending or future, fail.

enum class TrySendResult {
  OK,
  FULL,
  // The buffer holds `capacity` items already.
  CLOSED
  // The receiver has been dropped.
};

template <typename T>
class Sender;
template <typename T>
class Receiver;

template <typename T>
struct ChannelPair {
  Sender<T> sender;
  Receiver<T> receiver;
};

template <typename T>
ChannelPair<T> newChannel(size_t capacity);

namespace _ {  // private

template <typename T>
class ChannelState final: public kj::Refcounted {
public:
  explicit ChannelState(size_t capacity): capacity(capacity) {}

  const size_t capacity;
  std::deque<T> buffer;
  size_t senderCount = 1;
  bool receiverDropped = false;

  struct SpaceWaiter {
    kj::Own<kj::PromiseFulfiller<void>> fulfiller;
    bool* woken;
    // Set once this waiter is handed a free slot. Only touched while the waiter is waiting, so
    // the pointee is still alive.
  };

  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> dataWaiter;
  std::deque<SpaceWaiter> spaceWaiters;

  bool isFull() const { return buffer.size() >= capacity; }
  bool isClosed() const { return senderCount == 0; }

  void push(T&& value) {
    buffer.push_back(kj::mv(value));
    wakeReceiver();
  }

  void wakeReceiver() {
    KJ_IF_SOME(waiter, dataWaiter) {
      waiter->fulfill();
    }
    dataWaiter = kj::none;
  }

  void wakeOneSender() {
    // Waiters whose send was cancelled are skipped.
    while (!spaceWaiters.empty()) {
      auto waiter = kj::mv(spaceWaiters.front());
      spaceWaiters.pop_front();
      if (waiter.fulfiller->isWaiting()) {
        *waiter.woken = true;
        waiter.fulfiller->fulfill();
        return;
      }
    }
  }

  void wakeAllSenders() {
    auto waiters = kj::mv(spaceWaiters);
    spaceWaiters.clear();
    for (auto& waiter: waiters) {
      waiter.fulfiller->fulfill();
    }
  }

  kj::Promise<void> waitForData() {
    auto paf = kj::newPromiseAndFulfiller<void>();
    dataWaiter = kj::mv(paf.fulfiller);
    return kj::mv(paf.promise);
  }

  void passOnWakeup() {
    // A woken sender went away without using its slot; give the slot to the next one.
    if (!receiverDropped && !isFull()) {
      wakeOneSender();
    }
  }

  kj::Promise<void> waitForSpace(bool& woken) {
    auto paf = kj::newPromiseAndFulfiller<void>();
    spaceWaiters.push_back(SpaceWaiter { kj::mv(paf.fulfiller), &woken });
    return kj::mv(paf.promise);
  }
};

}  // namespace _ (private)

template <typename T>
class Sender {
public:
  Sender(Sender&& other) = default;
  Sender& operator=(Sender&& other) {
    if (this != &other) {
      release();
      state = kj::mv(other.state);
    }
    return *this;
  }
  KJ_DISALLOW_COPY(Sender);
  ~Sender() { release(); }

  TrySendResult trySend(T value) {
    // Enqueues without ever suspending. On failure the value is dropped.
    if (state->receiverDropped) return TrySendResult::CLOSED;
    if (state->isFull()) return TrySendResult::FULL;
    state->push(kj::mv(value));
    return TrySendResult::OK;
  }

  kj::Promise<bool> send(T value) {
    // Waits for buffer space, then enqueues. Resolves to false, dropping the value, if the
    // receiver goes away first. The returned promise does not refer to this Sender.
    return sendLoop(kj::addRef(*state), kj::mv(value));
  }

  Sender clone() {
    ++state->senderCount;
    return Sender(kj::addRef(*state));
  }

  bool isClosed() const { return state->receiverDropped; }
  size_t capacity() const { return state->capacity; }

private:
  kj::Own<_::ChannelState<T>> state;

  explicit Sender(kj::Own<_::ChannelState<T>> state): state(kj::mv(state)) {}

  void release() {
    if (state.get() == nullptr) return;
    if (--state->senderCount == 0) {
      state->wakeReceiver();
    }
    state = nullptr;
  }

  static kj::Promise<bool> sendLoop(kj::Own<_::ChannelState<T>> state, T value) {
    bool woken = false;
    KJ_DEFER(if (woken) state->passOnWakeup());

    for (;;) {
      if (state->receiverDropped) {
        co_return false;
      }
      if (!state->isFull()) {
        woken = false;
        state->push(kj::mv(value));
        co_return true;
      }
      // Another producer may take the freed slot first, so re-check after waking.
      woken = false;
      co_await state->waitForSpace(woken);
    }
  }

  template <typename U>
  friend ChannelPair<U> newChannel(size_t capacity);
};

template <typename T>
class Receiver {
public:
  Receiver(Receiver&& other) = default;
  Receiver& operator=(Receiver&& other) {
    if (this != &other) {
      release();
      state = kj::mv(other.state);
    }
    return *this;
  }
  KJ_DISALLOW_COPY(Receiver);
  ~Receiver() { release(); }

  kj::Promise<kj::Maybe<T>> receive() {
    // Resolves to the oldest buffered item, or to none once every sender is gone and the buffer
    // is empty. Only one receive() may be outstanding at a time.
    return receiveLoop(kj::addRef(*state));
  }

  bool isClosed() const { return state->isClosed(); }
  size_t size() const { return state->buffer.size(); }

private:
  kj::Own<_::ChannelState<T>> state;

  explicit Receiver(kj::Own<_::ChannelState<T>> state): state(kj::mv(state)) {}

  void release() {
    if (state.get() == nullptr) return;
    state->receiverDropped = true;
    state->buffer.clear();
    state->wakeAllSenders();
    state = nullptr;
  }

  static kj::Promise<kj::Maybe<T>> receiveLoop(kj::Own<_::ChannelState<T>> state) {
    for (;;) {
      if (!state->buffer.empty()) {
        T value = kj::mv(state->buffer.front());
        state->buffer.pop_front();
        state->wakeOneSender();
        co_return kj::Maybe<T>(kj::mv(value));
      }
      if (state->isClosed() || state->receiverDropped) {
        co_return kj::Maybe<T>(kj::none);
      }
      co_await state->waitForData();
    }
  }

  template <typename U>
  friend ChannelPair<U> newChannel(size_t capacity);
};

template <typename T>
ChannelPair<T> newChannel(size_t capacity) {
  KJ_REQUIRE(capacity > 0, "channel capacity must be positive");
  auto state = kj::refcounted<_::ChannelState<T>>(capacity);
  auto receiverState = kj::addRef(*state);
  return ChannelPair<T> { Sender<T>(kj::mv(state)), Receiver<T>(kj::mv(receiverState)) };
}

}  // namespace relay
