// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/async.h>

#include <memory>

namespace relay {

class CancellationToken {
  // A cloneable handle to a shared cancellation flag. Copies observe and set the same flag, and
  // the flag only ever goes from unset to set. A token belongs to the event loop of the thread
  // that created it.

public:
  CancellationToken();
  CancellationToken(const CancellationToken& other) = default;
  CancellationToken(CancellationToken&& other) = default;
  CancellationToken& operator=(const CancellationToken& other) = default;
  CancellationToken& operator=(CancellationToken&& other) = default;

  void cancel() const;
  // Sets the flag, resolves every promise returned by whenCancelled() and cancels all child
  // tokens. Calling it again has no effect.

  bool isCancelled() const;

  kj::Promise<void> whenCancelled() const;
  // Resolves once the token is cancelled, immediately if it already is.

  CancellationToken childToken() const;
  // Returns a new token which is cancelled whenever this one is. Cancelling the child leaves
  // this token untouched.

  template <typename T>
  kj::Promise<kj::Maybe<T>> runUntilCancelled(kj::Promise<T>&& body) const;
  // Races `body` against cancellation. Resolves to the body's value, or to none if the token was
  // cancelled first. When the token is already cancelled the body is dropped without being
  // awaited, and a body result that arrives after cancel() has been called is discarded, so
  // cancellation wins ties.

private:
  struct State;
  std::shared_ptr<State> state;

  explicit CancellationToken(std::shared_ptr<State> state);
};

// =======================================================================================
// inline implementation details

template <typename T>
kj::Promise<kj::Maybe<T>> CancellationToken::runUntilCancelled(kj::Promise<T>&& body) const {
  if (isCancelled()) {
    return kj::Maybe<T>(kj::none);
  }

  return whenCancelled()
      .then([]() -> kj::Maybe<T> { return kj::none; })
      .exclusiveJoin(kj::mv(body).then([self = *this](T&& value) -> kj::Maybe<T> {
        if (self.isCancelled()) {
          return kj::none;
        }
        return kj::mv(value);
      }));
}

}  // namespace relay
