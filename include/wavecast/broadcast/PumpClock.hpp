// Repository: wavecast
// Component: Pump Clock
// Purpose: Slice-indexed pacing clock for PacingPump.
// Copyright (c) 2025 wavecast
//
// PumpClock paces slice emission. In fixed-rate mode it sleeps to absolute
// deadlines anchored at Start(), so the time spent reading and fanning out a
// slice never accumulates as drift. In fixed-delay mode each wait is
// measured from the moment it begins, i.e. from the completion of the
// previous slice's work; long passes drift by the accumulated work time.

#ifndef WAVECAST_BROADCAST_PUMP_CLOCK_HPP_
#define WAVECAST_BROADCAST_PUMP_CLOCK_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "wavecast/broadcast/IWaitStrategy.hpp"

namespace wavecast::broadcast {

enum class PacingMode {
  kFixedRate,   // slice N at start + N * interval
  kFixedDelay,  // slice N at (end of slice N-1 work) + interval
};

const char* PacingModeToString(PacingMode mode);
bool ParsePacingMode(const std::string& text, PacingMode* out);

class PumpClock {
 public:
  // wait_strategy: nullptr selects RealtimeWaitStrategy.
  // Throws std::invalid_argument if interval is not positive.
  PumpClock(std::chrono::nanoseconds interval, PacingMode mode,
            std::unique_ptr<IWaitStrategy> wait_strategy = nullptr);

  // Record pass start. Must be called once before WaitForSlice().
  void Start();

  // Absolute fixed-rate deadline for slice N. Pure arithmetic.
  std::chrono::steady_clock::time_point DeadlineFor(int64_t slice_index) const;

  // Exact offset of slice N from pass start (fixed-rate). Exposed for testing.
  std::chrono::nanoseconds DeadlineOffsetNs(int64_t slice_index) const;

  // Wait until slice N may be emitted.
  // Returns false if Interrupt() was called before or during the wait.
  bool WaitForSlice(int64_t slice_index);

  // Thread-safe. Wakes the pump out of WaitForSlice() for good.
  void Interrupt();

  std::chrono::nanoseconds Interval() const { return interval_; }
  PacingMode Mode() const { return mode_; }
  std::chrono::steady_clock::time_point SessionStartTime() const { return session_start_; }

 private:
  const std::chrono::nanoseconds interval_;
  const PacingMode mode_;
  std::unique_ptr<IWaitStrategy> wait_strategy_;
  std::chrono::steady_clock::time_point session_start_;
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_PUMP_CLOCK_HPP_
