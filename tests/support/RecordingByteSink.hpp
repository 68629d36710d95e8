// Repository: wavecast
// Component: Recording Byte Sink (test only)
// Purpose: IByteSink that keeps every flushed write in memory and can be
//          told to fail after N writes.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_TESTS_SUPPORT_RECORDING_BYTE_SINK_HPP_
#define WAVECAST_TESTS_SUPPORT_RECORDING_BYTE_SINK_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <utility>
#include <string>
#include <vector>

#include "wavecast/output/IByteSink.h"

namespace wavecast::test_support {

// Shared state outlives the sink, which the session owns and destroys.
struct RecordingState {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::vector<uint8_t>> writes;
  std::vector<std::chrono::steady_clock::time_point> write_times;
  size_t flushes = 0;
  bool interrupted = false;
  bool closed = false;
  // When set, Flush() holds until Interrupt() or Close(), like a stalled peer.
  bool block_flushes = false;

  // Blocks until at least n writes were recorded. True on success.
  bool WaitForWrites(size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return writes.size() >= n; });
  }

  // Blocks until Flush() was entered at least n times. True on success.
  bool WaitForFlushes(size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return flushes >= n; });
  }

  size_t WriteCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return writes.size();
  }
};

class RecordingByteSink : public output::IByteSink {
 public:
  explicit RecordingByteSink(std::shared_ptr<RecordingState> state,
                             std::string name = "recording",
                             size_t fail_after_writes = std::numeric_limits<size_t>::max())
      : state_(std::move(state)), name_(std::move(name)), fail_after_(fail_after_writes) {}

  bool Write(const uint8_t* data, size_t len) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->interrupted || state_->closed || state_->writes.size() >= fail_after_) {
      return false;
    }
    state_->writes.emplace_back(data, data + len);
    state_->write_times.push_back(std::chrono::steady_clock::now());
    state_->cv.notify_all();
    return true;
  }

  bool Flush() override {
    std::unique_lock<std::mutex> lock(state_->mutex);
    ++state_->flushes;
    state_->cv.notify_all();
    if (state_->block_flushes) {
      state_->cv.wait(lock, [this] { return state_->interrupted || state_->closed; });
    }
    return !state_->interrupted && !state_->closed;
  }

  void Interrupt() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->interrupted = true;
    state_->cv.notify_all();
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->closed = true;
    state_->cv.notify_all();
  }

  std::string GetName() const override { return name_; }

 private:
  std::shared_ptr<RecordingState> state_;
  std::string name_;
  size_t fail_after_;
};

}  // namespace wavecast::test_support

#endif  // WAVECAST_TESTS_SUPPORT_RECORDING_BYTE_SINK_HPP_
