// Copyright (c) 2026, The Cap'n Proto Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <relay/cancellation.h>

#include <gtest/gtest.h>

namespace relay {
namespace {

class CancellationTest: public ::testing::Test {
protected:
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
};

TEST_F(CancellationTest, CopiesShareTheFlag) {
  CancellationToken token;
  auto copy = token;
  EXPECT_FALSE(copy.isCancelled());

  copy.cancel();
  EXPECT_TRUE(token.isCancelled());
  EXPECT_TRUE(copy.isCancelled());

  // Cancelling again is harmless.
  token.cancel();
  EXPECT_TRUE(token.isCancelled());
}

TEST_F(CancellationTest, WhenCancelledResolvesForEveryWaiter) {
  CancellationToken token;
  auto first = token.whenCancelled();
  auto second = token.whenCancelled();
  EXPECT_FALSE(first.poll(waitScope));

  token.cancel();
  EXPECT_TRUE(first.poll(waitScope));
  first.wait(waitScope);
  second.wait(waitScope);

  // Already cancelled: resolves immediately.
  token.whenCancelled().wait(waitScope);
}

TEST_F(CancellationTest, ChildFollowsParent) {
  CancellationToken parent;
  auto child = parent.childToken();
  auto grandchild = child.childToken();
  auto waiter = grandchild.whenCancelled();

  parent.cancel();
  EXPECT_TRUE(child.isCancelled());
  EXPECT_TRUE(grandchild.isCancelled());
  waiter.wait(waitScope);

  EXPECT_TRUE(parent.childToken().isCancelled());
}

TEST_F(CancellationTest, CancellingChildLeavesParent) {
  CancellationToken parent;
  auto child = parent.childToken();
  auto sibling = parent.childToken();

  child.cancel();
  EXPECT_TRUE(child.isCancelled());
  EXPECT_FALSE(parent.isCancelled());
  EXPECT_FALSE(sibling.isCancelled());
}

TEST_F(CancellationTest, DroppedChildDoesNotBlockParent) {
  CancellationToken parent;
  {
    auto child = parent.childToken();
  }
  auto survivor = parent.childToken();
  parent.cancel();
  EXPECT_TRUE(survivor.isCancelled());
}

TEST_F(CancellationTest, RunUntilCancelledPassesResultThrough) {
  CancellationToken token;
  auto result = token.runUntilCancelled(kj::Promise<int>(123)).wait(waitScope);
  EXPECT_EQ(KJ_ASSERT_NONNULL(result), 123);
}

TEST_F(CancellationTest, RunUntilCancelledInterruptsPendingBody) {
  CancellationToken token;
  auto paf = kj::newPromiseAndFulfiller<int>();
  auto promise = token.runUntilCancelled(kj::mv(paf.promise));
  EXPECT_FALSE(promise.poll(waitScope));

  token.cancel();
  EXPECT_TRUE(promise.wait(waitScope) == kj::none);
  // The body was dropped along with the race.
  EXPECT_FALSE(paf.fulfiller->isWaiting());
}

TEST_F(CancellationTest, RunUntilCancelledSkipsBodyWhenAlreadyCancelled) {
  CancellationToken token;
  token.cancel();
  bool ran = false;
  auto result = token.runUntilCancelled(kj::evalLater([&]() {
    ran = true;
    return 5;
  })).wait(waitScope);
  EXPECT_TRUE(result == kj::none);
  EXPECT_FALSE(ran);
}

TEST_F(CancellationTest, CancellationWinsTies) {
  CancellationToken token;
  auto paf = kj::newPromiseAndFulfiller<int>();
  auto promise = token.runUntilCancelled(kj::mv(paf.promise));

  paf.fulfiller->fulfill(7);
  token.cancel();
  EXPECT_TRUE(promise.wait(waitScope) == kj::none);
}

}  // namespace
}  // namespace relay
