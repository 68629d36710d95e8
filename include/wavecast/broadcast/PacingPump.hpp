// Repository: wavecast
// Component: PacingPump
// Purpose: Reads the payload once, start to end, in fixed-size slices and
//          fans each slice out through the ConsumerRegistry at a paced rate.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_PACING_PUMP_HPP_
#define WAVECAST_BROADCAST_PACING_PUMP_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "wavecast/broadcast/ConsumerRegistry.hpp"
#include "wavecast/broadcast/PumpClock.hpp"
#include "wavecast/broadcast/SlotBufferPool.hpp"
#include "wavecast/payload/Payload.hpp"

namespace wavecast::broadcast {

enum class PumpState {
  kIdle,       // constructed, pass not started
  kRunning,    // pass in progress
  kCompleted,  // reached end of payload
  kStopped,    // Stop() ended the pass early
};

const char* PumpStateToString(PumpState state);

// Invoked once on the pump thread when the pass ends (kCompleted or kStopped).
using PumpFinishedCallback = std::function<void(PumpState final_state)>;

// PacingPump runs one linear pass over the payload:
//
//   1. Check out one slot from the pool for the whole pass.
//   2. Read up to slot capacity bytes at the cursor.
//        end of payload → pass complete (no loop-back).
//        read fault     → log, count, retry the same cursor (no backoff).
//   3. Broadcast exactly the bytes read (never the unwritten tail).
//   4. Wait for the clock before the next slice. Slice 0 goes out at once;
//      nothing waits after the last slice.
//   5. The slot returns to the pool on every exit path.
//
// Slice size is the pool's slot size. Broadcast copies into each consumer's
// queue, so the slot is reused on the next iteration with no hand-off.
//
// Stop() interrupts the clock and ends the pass before the next slice.
class PacingPump {
 public:
  PacingPump(ConsumerRegistry& registry,
             SlotBufferPool& pool,
             std::unique_ptr<payload::IPayloadReader> reader,
             std::unique_ptr<PumpClock> clock);
  ~PacingPump();

  PacingPump(const PacingPump&) = delete;
  PacingPump& operator=(const PacingPump&) = delete;

  // Runs the pass on a dedicated thread. Returns false if already started.
  bool Start();

  // Runs the pass on the calling thread. Returns the final state.
  // Returns kIdle without doing anything if a pass was already started.
  PumpState Run();

  // Ends the pass early and joins the pump thread. Idempotent.
  // Safe to call from any thread except the pump thread itself.
  void Stop();

  // Blocks until the pass ends or timeout elapses. True if the pass ended.
  bool WaitForFinish(std::chrono::milliseconds timeout);

  void SetFinishedCallback(PumpFinishedCallback callback) { finished_callback_ = std::move(callback); }

  PumpState GetState() const { return state_.load(std::memory_order_acquire); }
  uint64_t GetSlicesEmitted() const { return slices_emitted_.load(std::memory_order_relaxed); }
  uint64_t GetBytesEmitted() const { return bytes_emitted_.load(std::memory_order_relaxed); }
  uint64_t GetReadErrors() const { return read_errors_.load(std::memory_order_relaxed); }

 private:
  bool TryBegin();
  void RunPass();
  void Finish(PumpState final_state);

  ConsumerRegistry& registry_;
  SlotBufferPool& pool_;
  std::unique_ptr<payload::IPayloadReader> reader_;
  std::unique_ptr<PumpClock> clock_;

  std::atomic<PumpState> state_{PumpState::kIdle};
  std::atomic<bool> stop_requested_{false};
  std::thread pump_thread_;

  std::mutex finish_mutex_;
  std::condition_variable finish_cv_;
  bool finished_ = false;
  PumpFinishedCallback finished_callback_;

  std::atomic<uint64_t> slices_emitted_{0};
  std::atomic<uint64_t> bytes_emitted_{0};
  std::atomic<uint64_t> read_errors_{0};
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_PACING_PUMP_HPP_
