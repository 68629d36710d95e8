// Repository: wavecast
// Component: Pump Clock
// Purpose: Slice-indexed pacing clock for PacingPump.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/PumpClock.hpp"

#include <stdexcept>
#include <utility>

namespace wavecast::broadcast {

const char* PacingModeToString(PacingMode mode) {
  switch (mode) {
    case PacingMode::kFixedRate: return "fixed-rate";
    case PacingMode::kFixedDelay: return "fixed-delay";
    default: return "unknown";
  }
}

bool ParsePacingMode(const std::string& text, PacingMode* out) {
  if (text == "fixed-rate") {
    *out = PacingMode::kFixedRate;
    return true;
  }
  if (text == "fixed-delay") {
    *out = PacingMode::kFixedDelay;
    return true;
  }
  return false;
}

PumpClock::PumpClock(std::chrono::nanoseconds interval, PacingMode mode,
                     std::unique_ptr<IWaitStrategy> wait_strategy)
    : interval_(interval),
      mode_(mode),
      wait_strategy_(std::move(wait_strategy)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("PumpClock requires a positive interval");
  }
  if (!wait_strategy_) {
    wait_strategy_ = std::make_unique<RealtimeWaitStrategy>();
  }
}

void PumpClock::Start() {
  session_start_ = std::chrono::steady_clock::now();
}

std::chrono::nanoseconds PumpClock::DeadlineOffsetNs(int64_t slice_index) const {
  return std::chrono::nanoseconds(slice_index * interval_.count());
}

std::chrono::steady_clock::time_point PumpClock::DeadlineFor(int64_t slice_index) const {
  return session_start_ + DeadlineOffsetNs(slice_index);
}

bool PumpClock::WaitForSlice(int64_t slice_index) {
  std::chrono::steady_clock::time_point deadline;
  if (mode_ == PacingMode::kFixedRate) {
    deadline = DeadlineFor(slice_index);
  } else {
    deadline = std::chrono::steady_clock::now() + interval_;
  }
  return wait_strategy_->WaitUntil(deadline);
}

void PumpClock::Interrupt() {
  wait_strategy_->Interrupt();
}

}  // namespace wavecast::broadcast
