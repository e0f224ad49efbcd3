// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "cancellation.h"

#include <kj/debug.h>

#include <algorithm>
#include <vector>

namespace relay {

struct CancellationToken::State {
  bool cancelled = false;

  kj::Maybe<kj::ForkedPromise<void>> onCancel;
  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> fulfiller;
  // Created lazily by the first whenCancelled() call.

  std::vector<std::weak_ptr<State>> children;
  // Children that are already gone are dropped whenever a new child is registered.

  void cancel() {
    if (cancelled) return;
    cancelled = true;

    KJ_IF_SOME(f, fulfiller) {
      f->fulfill();
    }

    auto toCancel = kj::mv(children);
    children.clear();
    for (auto& weak: toCancel) {
      if (auto child = weak.lock()) {
        child->cancel();
      }
    }
  }
};

CancellationToken::CancellationToken(): state(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state): state(kj::mv(state)) {}

void CancellationToken::cancel() const {
  state->cancel();
}

bool CancellationToken::isCancelled() const {
  return state->cancelled;
}

kj::Promise<void> CancellationToken::whenCancelled() const {
  if (state->cancelled) {
    return kj::READY_NOW;
  }

  if (state->onCancel == kj::none) {
    auto paf = kj::newPromiseAndFulfiller<void>();
    state->onCancel = paf.promise.fork();
    state->fulfiller = kj::mv(paf.fulfiller);
  }

  // Each branch holds a reference to the state, so the fulfiller outlives every waiter.
  return KJ_ASSERT_NONNULL(state->onCancel).addBranch().attach(std::shared_ptr<State>(state));
}

CancellationToken CancellationToken::childToken() const {
  auto child = std::make_shared<State>();
  if (state->cancelled) {
    child->cancelled = true;
  } else {
    auto& children = state->children;
    children.erase(std::remove_if(children.begin(), children.end(),
        [](const std::weak_ptr<State>& weak) { return weak.expired(); }), children.end());
    children.push_back(child);
  }
  return CancellationToken(kj::mv(child));
}

}  // namespace relay
