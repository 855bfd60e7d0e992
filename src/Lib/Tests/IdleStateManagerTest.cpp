#include <atomic>    // std::atomic
#include <stdexcept> // std::runtime_error
#include <thread>    // std::this_thread::sleep_for

#include <SignRelay/Avatar/IdleStateManager.hpp>
#include <SignRelay/Utils/Clock.hpp>
#include <SignRelay/Utils/Types.hpp>

#include "Support/ManualClock.hpp"
#include "gtest/gtest.h"

using namespace testing;
using namespace signrelay::utils::types;
using namespace signrelay::avatar;
using signrelay::test_support::ManualClock;
using signrelay::utils::clock::SystemClock;

class IdleStateManagerTest : public Test {
 protected:
  SharedPointer<ManualClock> m_clock = std::make_shared<ManualClock>();
  IdleStateManager           m_manager { { .idleTimeoutMs = 3000, .transitionDurationMs = 500 }, m_clock, false };
  Vec<String>                m_edges;

  fn SetUp() -> Unit override {
    m_manager.setCallbacks({
      .onIdleStart       = [this] { m_edges.emplace_back("idleStart"); },
      .onIdleEnd         = [this] { m_edges.emplace_back("idleEnd"); },
      .onTransitionStart = [this] { m_edges.emplace_back("transitionStart"); },
      .onTransitionEnd   = [this] { m_edges.emplace_back("transitionEnd"); },
    });
  }

  fn advanceAndPoll(const i64 deltaMs) -> Unit {
    m_clock->advance(deltaMs);
    m_manager.poll();
  }
};

TEST_F(IdleStateManagerTest, StartsIdle) {
  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_FALSE(m_manager.isActive());
  EXPECT_FALSE(m_manager.isTransitioning());

  advanceAndPoll(60'000);

  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_TRUE(m_edges.empty());
}

TEST_F(IdleStateManagerTest, SignalActivity_WakesThroughTransition) {
  m_manager.signalActivity();

  EXPECT_TRUE(m_manager.isTransitioning());
  EXPECT_EQ(m_edges, (Vec<String> { "idleEnd", "transitionStart" }));

  advanceAndPoll(499);
  EXPECT_TRUE(m_manager.isTransitioning());

  advanceAndPoll(1);
  EXPECT_TRUE(m_manager.isActive());
  EXPECT_EQ(m_edges.back(), "transitionEnd");
}

TEST_F(IdleStateManagerTest, FullCycle_EdgesInOrder) {
  m_manager.signalActivity();
  advanceAndPoll(500);
  advanceAndPoll(2500);

  EXPECT_TRUE(m_manager.isTransitioning());

  advanceAndPoll(500);

  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_EQ(m_edges, (Vec<String> { "idleEnd", "transitionStart", "transitionEnd", "transitionStart", "transitionEnd", "idleStart" }));
}

TEST_F(IdleStateManagerTest, Poll_CatchesUpOnMissedDeadlines) {
  m_manager.signalActivity();
  m_edges.clear();

  advanceAndPoll(10'000);

  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_EQ(m_edges, (Vec<String> { "transitionEnd", "transitionStart", "transitionEnd", "idleStart" }));
}

TEST_F(IdleStateManagerTest, SignalActivity_WhileActiveDefersIdle) {
  m_manager.signalActivity();
  advanceAndPoll(500);

  m_edges.clear();

  advanceAndPoll(2000);
  m_manager.signalActivity();
  m_manager.signalActivity();

  advanceAndPoll(2000);
  EXPECT_TRUE(m_manager.isActive());
  EXPECT_TRUE(m_edges.empty());

  advanceAndPoll(1000);
  EXPECT_TRUE(m_manager.isTransitioning());
}

TEST_F(IdleStateManagerTest, SignalActivity_DuringTransitionToIdleReturnsToActive) {
  m_manager.signalActivity();
  advanceAndPoll(3000);
  advanceAndPoll(200);

  ASSERT_TRUE(m_manager.isTransitioning());
  m_edges.clear();

  m_manager.signalActivity();

  EXPECT_TRUE(m_manager.isTransitioning());
  EXPECT_TRUE(m_edges.empty());

  advanceAndPoll(499);
  EXPECT_TRUE(m_manager.isTransitioning());

  advanceAndPoll(1);
  EXPECT_TRUE(m_manager.isActive());
  EXPECT_EQ(m_edges, (Vec<String> { "transitionEnd" }));
}

TEST_F(IdleStateManagerTest, ForceIdle_FromActive) {
  m_manager.signalActivity();
  advanceAndPoll(500);
  m_edges.clear();

  m_manager.forceIdle();

  EXPECT_TRUE(m_manager.isTransitioning());
  EXPECT_EQ(m_edges, (Vec<String> { "transitionStart" }));

  advanceAndPoll(500);

  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_EQ(m_edges.back(), "idleStart");
}

TEST_F(IdleStateManagerTest, ForceIdle_WhenIdleDoesNothing) {
  m_manager.forceIdle();

  EXPECT_TRUE(m_manager.isIdle());
  EXPECT_TRUE(m_edges.empty());
}

TEST_F(IdleStateManagerTest, UpdateConfig_AppliesToCurrentDeadline) {
  m_manager.signalActivity();
  advanceAndPoll(500);

  m_manager.updateConfig({ .idleTimeoutMs = 1000, .transitionDurationMs = 100 });

  advanceAndPoll(500);
  EXPECT_TRUE(m_manager.isTransitioning());

  advanceAndPoll(100);
  EXPECT_TRUE(m_manager.isIdle());
}

TEST_F(IdleStateManagerTest, TimeSinceLastActivity) {
  m_manager.signalActivity();
  m_clock->advance(1234);

  EXPECT_EQ(m_manager.timeSinceLastActivity(), 1234);

  m_manager.signalActivity();
  EXPECT_EQ(m_manager.timeSinceLastActivity(), 0);
}

TEST_F(IdleStateManagerTest, ThrowingCallbackDoesNotStopLaterEdges) {
  m_manager.setCallbacks({
    .onIdleStart       = {},
    .onIdleEnd         = [] { throw std::runtime_error("boom"); },
    .onTransitionStart = [this] { m_edges.emplace_back("transitionStart"); },
    .onTransitionEnd   = {},
  });

  m_manager.signalActivity();

  EXPECT_TRUE(m_manager.isTransitioning());
  EXPECT_EQ(m_edges, (Vec<String> { "transitionStart" }));
}

TEST(IdleStateManagerTimerTest, ReturnsToIdleOnItsOwn) {
  IdleStateManager manager({ .idleTimeoutMs = 100, .transitionDurationMs = 50 }, std::make_shared<SystemClock>());

  std::atomic<i32> idleStarts = 0;

  manager.setCallbacks({ .onIdleStart = [&idleStarts] { ++idleStarts; }, .onIdleEnd = {}, .onTransitionStart = {}, .onTransitionEnd = {} });

  manager.signalActivity();

  std::this_thread::sleep_for(Millis(10));
  EXPECT_TRUE(manager.isActive() || manager.isTransitioning());

  std::this_thread::sleep_for(Millis(250));
  EXPECT_TRUE(manager.isIdle());
  EXPECT_EQ(idleStarts.load(), 1);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
