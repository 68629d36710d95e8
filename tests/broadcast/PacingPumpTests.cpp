// Repository: wavecast
// Component: PacingPump Unit Tests
// Purpose: Slice boundaries, pacing deadlines, read-error retry, and stop.
//          Uses DeterministicWaitStrategy so no test sleeps between slices.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/PacingPump.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "support/DeterministicWaitStrategy.hpp"

using namespace wavecast::broadcast;
using namespace wavecast::payload;
using wavecast::test_support::DeterministicWaitStrategy;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<const Payload> MakePayload(size_t size) {
  std::vector<uint8_t> bytes(size);
  for (size_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<uint8_t>(i * 31 + 7);
  }
  return std::make_shared<const Payload>(std::move(bytes), "audio/aac", "memory");
}

// Fails the first N reads, then delegates.
class FlakyReader : public IPayloadReader {
 public:
  FlakyReader(std::shared_ptr<const Payload> payload, int failures)
      : inner_(std::move(payload)), failures_(failures) {}

  ReadResult Read(uint8_t* dst, size_t capacity) override {
    if (failures_ > 0) {
      --failures_;
      ReadResult result;
      result.status = ReadStatus::kError;
      result.error = "injected";
      return result;
    }
    return inner_.Read(dst, capacity);
  }

 private:
  PayloadReader inner_;
  int failures_;
};

class PacingPumpTest : public ::testing::Test {
 protected:
  // Builds a pump over payload with a deterministic clock.
  std::unique_ptr<PacingPump> MakePump(std::unique_ptr<IPayloadReader> reader,
                                       size_t slice_size,
                                       DeterministicWaitStrategy::WaitHook hook = nullptr) {
    pool_ = std::make_unique<SlotBufferPool>(slice_size);
    auto strategy = std::make_unique<DeterministicWaitStrategy>(std::move(hook));
    wait_ = strategy.get();
    auto clock = std::make_unique<PumpClock>(150ms, PacingMode::kFixedRate, std::move(strategy));
    clock_ = clock.get();
    return std::make_unique<PacingPump>(registry_, *pool_, std::move(reader), std::move(clock));
  }

  // Listeners outlive registry_, which still points at them until CloseAll.
  Consumer& AddListener() {
    listeners_.push_back(std::make_unique<Consumer>("listener", ConsumerQueue::kUnbounded));
    EXPECT_TRUE(registry_.Add(listeners_.back().get()));
    return *listeners_.back();
  }

  static std::vector<SliceBytes> Drain(Consumer& consumer) {
    std::vector<SliceBytes> slices;
    while (auto slice = consumer.Queue().TryReceive()) {
      slices.push_back(std::move(*slice));
    }
    return slices;
  }

  std::vector<std::unique_ptr<Consumer>> listeners_;
  ConsumerRegistry registry_;
  std::unique_ptr<SlotBufferPool> pool_;
  DeterministicWaitStrategy* wait_ = nullptr;
  PumpClock* clock_ = nullptr;
};

// ======================================================================
// Slicing
// ======================================================================

TEST_F(PacingPumpTest, SlicesCoverPayloadWithShortFinalSlice) {
  auto payload = MakePayload(20000);
  Consumer& listener = AddListener();

  auto pump = MakePump(std::make_unique<PayloadReader>(payload), 8192);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);

  auto slices = Drain(listener);
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].size(), 8192u);
  EXPECT_EQ(slices[1].size(), 8192u);
  EXPECT_EQ(slices[2].size(), 3616u);

  std::vector<uint8_t> joined;
  for (const auto& slice : slices) {
    joined.insert(joined.end(), slice.begin(), slice.end());
  }
  EXPECT_TRUE(std::equal(joined.begin(), joined.end(), payload->data(),
                         payload->data() + payload->size()));
  EXPECT_EQ(pump->GetSlicesEmitted(), 3u);
  EXPECT_EQ(pump->GetBytesEmitted(), 20000u);
}

TEST_F(PacingPumpTest, ExactMultipleHasNoTrailingEmptySlice) {
  Consumer& listener = AddListener();
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(16384)), 8192);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);

  auto slices = Drain(listener);
  ASSERT_EQ(slices.size(), 2u);
  EXPECT_EQ(slices[1].size(), 8192u);
  EXPECT_EQ(wait_->Deadlines().size(), 1u);
}

TEST_F(PacingPumpTest, EmptyPayloadCompletesWithoutSlices) {
  Consumer& listener = AddListener();
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(0)), 8192);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);
  EXPECT_EQ(listener.Queue().Depth(), 0u);
  EXPECT_EQ(pump->GetSlicesEmitted(), 0u);
  EXPECT_TRUE(wait_->Deadlines().empty());
}

TEST_F(PacingPumpTest, RunsWithNoConsumers) {
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(5000)), 1000);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);
  EXPECT_EQ(pump->GetSlicesEmitted(), 5u);
  EXPECT_EQ(registry_.GetDeliveries(), 0u);
}

// ======================================================================
// Pacing
// ======================================================================

TEST_F(PacingPumpTest, FirstSliceImmediateThenAbsoluteDeadlines) {
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(4 * 100)), 100);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);

  // Four slices need three waits: none before the first, none after the last.
  auto deadlines = wait_->Deadlines();
  ASSERT_EQ(deadlines.size(), 3u);
  const auto start = clock_->SessionStartTime();
  EXPECT_EQ(deadlines[0], start + 150ms);
  EXPECT_EQ(deadlines[1], start + 300ms);
  EXPECT_EQ(deadlines[2], start + 450ms);
}

TEST_F(PacingPumpTest, SliceIsBroadcastOnlyAfterItsWait) {
  Consumer& listener = AddListener();
  std::vector<size_t> depth_at_wait;
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(300)), 100,
                       [&](size_t) { depth_at_wait.push_back(listener.Queue().Depth()); });
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);
  EXPECT_EQ(depth_at_wait, (std::vector<size_t>{1, 2}));
}

// ======================================================================
// Errors and lifecycle
// ======================================================================

TEST_F(PacingPumpTest, ReadErrorsAreRetriedWithoutLosingBytes) {
  Consumer& listener = AddListener();
  auto pump = MakePump(std::make_unique<FlakyReader>(MakePayload(2500), 3), 1000);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);
  EXPECT_EQ(pump->GetReadErrors(), 3u);
  EXPECT_EQ(pump->GetBytesEmitted(), 2500u);
  EXPECT_EQ(Drain(listener).size(), 3u);
}

TEST_F(PacingPumpTest, ConstructorRejectsMissingCollaborators) {
  SlotBufferPool pool(16);
  auto clock = std::make_unique<PumpClock>(1ms, PacingMode::kFixedRate);
  EXPECT_THROW(PacingPump(registry_, pool, nullptr, std::move(clock)), std::invalid_argument);
  EXPECT_THROW(PacingPump(registry_, pool, std::make_unique<PayloadReader>(MakePayload(1)),
                          nullptr),
               std::invalid_argument);
}

TEST_F(PacingPumpTest, PassRunsOnlyOnce) {
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(10)), 4);
  EXPECT_EQ(pump->Run(), PumpState::kCompleted);
  EXPECT_EQ(pump->Run(), PumpState::kIdle);
  EXPECT_FALSE(pump->Start());
  EXPECT_EQ(pump->GetState(), PumpState::kCompleted);
}

TEST_F(PacingPumpTest, StartRunsPassOnThreadAndReportsCompletion) {
  std::atomic<int> callbacks{0};
  auto pump = MakePump(std::make_unique<PayloadReader>(MakePayload(1000)), 100);
  pump->SetFinishedCallback([&](PumpState state) {
    EXPECT_EQ(state, PumpState::kCompleted);
    callbacks.fetch_add(1);
  });
  ASSERT_TRUE(pump->Start());
  ASSERT_TRUE(pump->WaitForFinish(5s));
  EXPECT_EQ(pump->GetState(), PumpState::kCompleted);
  EXPECT_EQ(callbacks.load(), 1);
  EXPECT_EQ(pool_->OutstandingCount(), 0u);
  pump->Stop();
}

TEST_F(PacingPumpTest, StopDuringWaitEndsPassAndReleasesSlot) {
  Consumer& listener = AddListener();
  SlotBufferPool pool(100);
  auto clock = std::make_unique<PumpClock>(std::chrono::seconds(30), PacingMode::kFixedRate);
  PacingPump pump(registry_, pool, std::make_unique<PayloadReader>(MakePayload(1000)),
                  std::move(clock));

  ASSERT_TRUE(pump.Start());
  // The first slice goes out immediately; the second waits 30s.
  auto first = listener.Queue().Receive();
  ASSERT_TRUE(first.has_value());

  const auto before = std::chrono::steady_clock::now();
  pump.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
  EXPECT_EQ(pump.GetState(), PumpState::kStopped);
  EXPECT_EQ(pump.GetSlicesEmitted(), 1u);
  EXPECT_EQ(pool.OutstandingCount(), 0u);
  EXPECT_TRUE(pump.WaitForFinish(0ms));
}

TEST(PacingPumpStateTest, StateNames) {
  EXPECT_STREQ(PumpStateToString(PumpState::kIdle), "idle");
  EXPECT_STREQ(PumpStateToString(PumpState::kRunning), "running");
  EXPECT_STREQ(PumpStateToString(PumpState::kCompleted), "completed");
  EXPECT_STREQ(PumpStateToString(PumpState::kStopped), "stopped");
}

}  // namespace
