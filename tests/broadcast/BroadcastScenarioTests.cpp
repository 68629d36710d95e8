// Repository: wavecast
// Component: Broadcast Scenario Tests
// Purpose: End-to-end fan-out behavior: pacing on the wire, late joiners,
//          slow-listener isolation, and end-of-pass drain through sessions.
// Copyright (c) 2025 wavecast

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "wavecast/broadcast/ConsumerRegistry.hpp"
#include "wavecast/broadcast/PacingPump.hpp"
#include "wavecast/broadcast/SlotBufferPool.hpp"
#include "wavecast/output/ConsumerSession.h"
#include "wavecast/payload/Payload.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "support/RecordingByteSink.hpp"

using namespace wavecast::broadcast;
using namespace wavecast::payload;
using wavecast::output::ConsumerSession;
using wavecast::output::SessionEndReason;
using wavecast::test_support::DeterministicWaitStrategy;
using wavecast::test_support::RecordingByteSink;
using wavecast::test_support::RecordingState;
using namespace std::chrono_literals;

namespace {

constexpr size_t kPayloadBytes = 20000;
constexpr size_t kSliceBytes = 8192;
constexpr auto kDelay = 150ms;

std::shared_ptr<const Payload> ScenarioPayload() {
  std::vector<uint8_t> bytes(kPayloadBytes);
  for (size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(i % 251);
  }
  return std::make_shared<const Payload>(std::move(bytes), "audio/aac", "scenario");
}

// ======================================================================
// Real-time pacing seen by a listener
// ======================================================================

TEST(BroadcastScenarioTest, ListenerSeesThreePacedSlices) {
  Consumer listener("listener", ConsumerQueue::kUnbounded);
  ConsumerRegistry registry;
  ASSERT_TRUE(registry.Add(&listener));
  SlotBufferPool pool(kSliceBytes);
  auto clock = std::make_unique<PumpClock>(kDelay, PacingMode::kFixedRate);
  PumpClock* clock_view = clock.get();
  PacingPump pump(registry, pool, std::make_unique<PayloadReader>(ScenarioPayload()),
                  std::move(clock));

  const auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(pump.Start());
  std::vector<size_t> sizes;
  std::vector<std::chrono::steady_clock::time_point> arrivals;
  for (int i = 0; i < 3; ++i) {
    auto slice = listener.Queue().Receive();
    ASSERT_TRUE(slice.has_value());
    arrivals.push_back(std::chrono::steady_clock::now());
    sizes.push_back(slice->size());
  }
  ASSERT_TRUE(pump.WaitForFinish(5s));
  EXPECT_EQ(pump.GetState(), PumpState::kCompleted);

  EXPECT_EQ(sizes, (std::vector<size_t>{8192, 8192, 3616}));
  // No slice arrives before its deadline; the first is not held back.
  EXPECT_GE(arrivals[1], clock_view->DeadlineFor(1));
  EXPECT_GE(arrivals[2], clock_view->DeadlineFor(2));
  EXPECT_GE(arrivals[2] - started, 2 * kDelay);
  EXPECT_LT(arrivals[0] - started, kDelay);
  EXPECT_EQ(listener.Queue().Depth(), 0u);
  ASSERT_TRUE(registry.Remove(&listener));
}

// ======================================================================
// Membership during a pass
// ======================================================================

TEST(BroadcastScenarioTest, LateJoinerReceivesOnlyLaterSlices) {
  Consumer early("early", ConsumerQueue::kUnbounded);
  Consumer late("late", ConsumerQueue::kUnbounded);
  ConsumerRegistry registry;
  ASSERT_TRUE(registry.Add(&early));

  SlotBufferPool pool(kSliceBytes);
  // Wait 0 sits between slice 1 and slice 2.
  auto strategy = std::make_unique<DeterministicWaitStrategy>([&](size_t wait_index) {
    if (wait_index == 0) {
      EXPECT_TRUE(registry.Add(&late));
    }
  });
  PacingPump pump(registry, pool, std::make_unique<PayloadReader>(ScenarioPayload()),
                  std::make_unique<PumpClock>(kDelay, PacingMode::kFixedRate,
                                              std::move(strategy)));
  EXPECT_EQ(pump.Run(), PumpState::kCompleted);

  EXPECT_EQ(early.Queue().Depth(), 3u);
  ASSERT_EQ(late.Queue().Depth(), 2u);
  EXPECT_EQ(late.Queue().TryReceive()->size(), 8192u);
  EXPECT_EQ(late.Queue().TryReceive()->size(), 3616u);
}

TEST(BroadcastScenarioTest, SlowListenerIsIsolated) {
  Consumer stuck("stuck", 1);
  Consumer healthy("healthy", ConsumerQueue::kUnbounded);
  ConsumerRegistry registry;
  ASSERT_TRUE(registry.Add(&stuck));
  ASSERT_TRUE(registry.Add(&healthy));

  SlotBufferPool pool(kSliceBytes);
  auto strategy = std::make_unique<DeterministicWaitStrategy>();
  DeterministicWaitStrategy* wait = strategy.get();
  auto clock = std::make_unique<PumpClock>(kDelay, PacingMode::kFixedRate, std::move(strategy));
  PumpClock* clock_view = clock.get();
  PacingPump pump(registry, pool, std::make_unique<PayloadReader>(ScenarioPayload()),
                  std::move(clock));
  EXPECT_EQ(pump.Run(), PumpState::kCompleted);

  EXPECT_EQ(stuck.Queue().AcceptedCount(), 1u);
  EXPECT_EQ(stuck.Queue().DroppedCount(), 2u);
  EXPECT_EQ(healthy.Queue().Depth(), 3u);
  EXPECT_EQ(healthy.Queue().DroppedCount(), 0u);

  // The schedule is the one an unobstructed pass would have.
  auto deadlines = wait->Deadlines();
  ASSERT_EQ(deadlines.size(), 2u);
  EXPECT_EQ(deadlines[0], clock_view->DeadlineFor(1));
  EXPECT_EQ(deadlines[1], clock_view->DeadlineFor(2));
}

// ======================================================================
// Sessions through the end of a pass
// ======================================================================

TEST(BroadcastScenarioTest, SessionsDeliverFinalSliceBeforeShutdown) {
  ConsumerRegistry registry;
  constexpr int kSessions = 3;
  std::vector<std::shared_ptr<RecordingState>> states;
  std::vector<std::unique_ptr<ConsumerSession>> sessions;
  for (int i = 0; i < kSessions; ++i) {
    states.push_back(std::make_shared<RecordingState>());
    sessions.push_back(std::make_unique<ConsumerSession>(
        registry, std::make_unique<RecordingByteSink>(states.back(), "listener-" + std::to_string(i)),
        ConsumerQueue::kUnbounded));
    ASSERT_TRUE(sessions.back()->Open());
  }

  std::vector<SessionEndReason> reasons(kSessions, SessionEndReason::kNotRegistered);
  std::vector<std::thread> threads;
  for (int i = 0; i < kSessions; ++i) {
    threads.emplace_back([&, i] { reasons[i] = sessions[i]->Run(); });
  }

  SlotBufferPool pool(kSliceBytes);
  PacingPump pump(registry, pool, std::make_unique<PayloadReader>(ScenarioPayload()),
                  std::make_unique<PumpClock>(20ms, PacingMode::kFixedRate));
  pump.SetFinishedCallback([&](PumpState) { registry.CloseAll(); });
  EXPECT_EQ(pump.Run(), PumpState::kCompleted);

  for (auto& thread : threads) {
    thread.join();
  }
  for (int i = 0; i < kSessions; ++i) {
    EXPECT_EQ(reasons[i], SessionEndReason::kQueueClosed);
    ASSERT_EQ(states[i]->WriteCount(), 3u);
    EXPECT_EQ(states[i]->writes[2].size(), 3616u);
    EXPECT_FALSE(sessions[i]->IsRegistered());
  }
  EXPECT_EQ(registry.Size(), 0u);
}

}  // namespace
