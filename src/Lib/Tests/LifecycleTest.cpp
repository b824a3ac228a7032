#include <Plm/Core/Lifecycle.hpp>
#include <Plm/Core/OperationLock.hpp>
#include <Plm/Utils/Types.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"

using namespace testing;
using namespace std::chrono_literals;

using plm::core::plugin::IsDefinedState;
using plm::core::plugin::IsTerminal;
using plm::core::plugin::IsTransitionAllowed;
using plm::core::plugin::LifecycleState;
using plm::core::plugin::OperationLock;
using plm::core::plugin::StateName;
using plm::utils::types::i32;
using plm::utils::types::Mutex;
using plm::utils::types::u8;
using plm::utils::types::Vec;

class LifecycleTest : public Test {};

TEST_F(LifecycleTest, ForwardPathIsAllowed) {
  using enum LifecycleState;

  EXPECT_TRUE(IsTransitionAllowed(Unregistered, Registered));
  EXPECT_TRUE(IsTransitionAllowed(Registered, Initialized));
  EXPECT_TRUE(IsTransitionAllowed(Initialized, Installed));
  EXPECT_TRUE(IsTransitionAllowed(Installed, Initialized));
  EXPECT_TRUE(IsTransitionAllowed(Installed, ShuttingDown));
  EXPECT_TRUE(IsTransitionAllowed(Initialized, ShuttingDown));
  EXPECT_TRUE(IsTransitionAllowed(ShuttingDown, Shutdown));
}

TEST_F(LifecycleTest, RegisteredEntriesCanBeDroppedDirectly) {
  EXPECT_TRUE(IsTransitionAllowed(LifecycleState::Registered, LifecycleState::Unregistered));
  EXPECT_FALSE(IsTransitionAllowed(LifecycleState::Initialized, LifecycleState::Unregistered));
}

TEST_F(LifecycleTest, ReinstallIsTheOnlySelfTransition) {
  using enum LifecycleState;

  EXPECT_TRUE(IsTransitionAllowed(Installed, Installed));
  EXPECT_FALSE(IsTransitionAllowed(Registered, Registered));
  EXPECT_FALSE(IsTransitionAllowed(Initialized, Initialized));
  EXPECT_FALSE(IsTransitionAllowed(Shutdown, Shutdown));
}

TEST_F(LifecycleTest, SkippingStagesIsRejected) {
  using enum LifecycleState;

  EXPECT_FALSE(IsTransitionAllowed(Registered, Installed));
  EXPECT_FALSE(IsTransitionAllowed(Registered, ShuttingDown));
  EXPECT_FALSE(IsTransitionAllowed(Initialized, Shutdown));
  EXPECT_FALSE(IsTransitionAllowed(Unregistered, Initialized));
}

TEST_F(LifecycleTest, ShutdownIsFinal) {
  using enum LifecycleState;

  for (const LifecycleState target : { Unregistered, Registered, Initialized, Installed, ShuttingDown })
    EXPECT_FALSE(IsTransitionAllowed(Shutdown, target)) << StateName(target);
}

TEST_F(LifecycleTest, FailedShutdownCanRollBack) {
  using enum LifecycleState;

  EXPECT_TRUE(IsTransitionAllowed(ShuttingDown, Initialized));
  EXPECT_TRUE(IsTransitionAllowed(ShuttingDown, Installed));
  EXPECT_FALSE(IsTransitionAllowed(ShuttingDown, Registered));
}

TEST_F(LifecycleTest, TerminalStates) {
  EXPECT_TRUE(IsTerminal(LifecycleState::Unregistered));
  EXPECT_TRUE(IsTerminal(LifecycleState::Shutdown));
  EXPECT_FALSE(IsTerminal(LifecycleState::Registered));
  EXPECT_FALSE(IsTerminal(LifecycleState::Installed));
}

TEST_F(LifecycleTest, StateNamesComeFromTheEnum) {
  EXPECT_EQ(StateName(LifecycleState::Initialized), "Initialized");
  EXPECT_EQ(StateName(LifecycleState::ShuttingDown), "ShuttingDown");
  EXPECT_EQ(StateName(static_cast<LifecycleState>(u8 { 42 })), "Undefined");
}

TEST_F(LifecycleTest, OutOfRangeValuesAreNotDefinedStates) {
  EXPECT_TRUE(IsDefinedState(LifecycleState::Shutdown));
  EXPECT_FALSE(IsDefinedState(static_cast<LifecycleState>(u8 { 42 })));
}

class OperationLockTest : public Test {};

TEST_F(OperationLockTest, TryAcquireFailsWhileHeld) {
  OperationLock lock;

  ASSERT_TRUE(lock.tryAcquire());
  EXPECT_TRUE(lock.isHeld());
  EXPECT_FALSE(lock.tryAcquire());

  lock.release();
  EXPECT_FALSE(lock.isHeld());
  EXPECT_TRUE(lock.tryAcquire());
  lock.release();
}

TEST_F(OperationLockTest, MayBeReleasedFromAnotherThread) {
  OperationLock lock;
  lock.acquire();

  std::thread releaser([&lock] { lock.release(); });
  releaser.join();

  EXPECT_FALSE(lock.isHeld());
}

TEST_F(OperationLockTest, WaitersAreServedInArrivalOrder) {
  OperationLock lock;
  lock.acquire();

  Mutex    orderMutex;
  Vec<i32> order;

  std::atomic<i32>  queued = 0;
  Vec<std::thread> waiters;

  for (i32 idx = 0; idx < 3; ++idx) {
    // Start each waiter only once the previous one has taken its ticket.
    waiters.emplace_back([&, idx] {
      ++queued;
      lock.acquire();
      {
        const plm::utils::types::LockGuard guard(orderMutex);
        order.push_back(idx);
      }
      lock.release();
    });

    while (queued.load() <= idx)
      std::this_thread::sleep_for(1ms);

    std::this_thread::sleep_for(20ms);
  }

  lock.release();

  for (std::thread& waiter : waiters)
    waiter.join();

  EXPECT_EQ(order, (Vec<i32> { 0, 1, 2 }));
}

TEST_F(OperationLockTest, TimedAcquireGivesUpWhileHeld) {
  OperationLock lock;
  lock.acquire();

  EXPECT_FALSE(lock.acquireUntil(std::chrono::steady_clock::now() + 20ms));
  EXPECT_TRUE(lock.isHeld());

  lock.release();

  EXPECT_FALSE(lock.isHeld());
  EXPECT_TRUE(lock.tryAcquire());
  lock.release();
}

TEST_F(OperationLockTest, TimedAcquireSucceedsWhenReleasedInTime) {
  OperationLock lock;
  lock.acquire();

  std::thread releaser([&lock] {
    std::this_thread::sleep_for(20ms);
    lock.release();
  });

  EXPECT_TRUE(lock.acquireUntil(std::chrono::steady_clock::now() + 5s));

  releaser.join();
  lock.release();
  EXPECT_FALSE(lock.isHeld());
}

TEST_F(OperationLockTest, GivenUpPlaceIsSkippedForTheNextWaiter) {
  OperationLock lock;
  lock.acquire();

  std::thread impatient([&lock] { EXPECT_FALSE(lock.acquireUntil(std::chrono::steady_clock::now() + 10ms)); });
  impatient.join();

  std::atomic<bool> served = false;
  std::thread       patient([&lock, &served] {
    lock.acquire();
    served = true;
    lock.release();
  });

  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(served.load());

  lock.release();
  patient.join();

  EXPECT_TRUE(served.load());
  EXPECT_FALSE(lock.isHeld());
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
