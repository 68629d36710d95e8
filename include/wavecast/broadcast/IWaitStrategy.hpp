// Repository: wavecast
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in PumpClock.
//          Production: RealtimeWaitStrategy sleeps until deadline, and can be
//          interrupted so the pump stops promptly.
//          Tests: DeterministicWaitStrategy (records deadlines, no sleep).
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_IWAIT_STRATEGY_HPP_
#define WAVECAST_BROADCAST_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace wavecast::broadcast {

class IWaitStrategy {
 public:
  // Blocks until deadline. Returns false if interrupted first.
  virtual bool WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;

  // Sticky: the current wait and every later wait return false.
  virtual void Interrupt() = 0;

  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return interrupted_; });
    return !interrupted_;
  }

  void Interrupt() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_IWAIT_STRATEGY_HPP_
