// Repository: wavecast
// Component: PacingPump
// Purpose: Reads the payload once, start to end, in fixed-size slices and
//          fans each slice out through the ConsumerRegistry at a paced rate.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/PacingPump.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "wavecast/util/Logger.hpp"

namespace wavecast::broadcast {

using util::Logger;

const char* PumpStateToString(PumpState state) {
  switch (state) {
    case PumpState::kIdle: return "idle";
    case PumpState::kRunning: return "running";
    case PumpState::kCompleted: return "completed";
    case PumpState::kStopped: return "stopped";
    default: return "unknown";
  }
}

PacingPump::PacingPump(ConsumerRegistry& registry,
                       SlotBufferPool& pool,
                       std::unique_ptr<payload::IPayloadReader> reader,
                       std::unique_ptr<PumpClock> clock)
    : registry_(registry),
      pool_(pool),
      reader_(std::move(reader)),
      clock_(std::move(clock)) {
  if (!reader_) {
    throw std::invalid_argument("PacingPump requires a payload reader");
  }
  if (!clock_) {
    throw std::invalid_argument("PacingPump requires a clock");
  }
}

PacingPump::~PacingPump() {
  Stop();
}

bool PacingPump::TryBegin() {
  PumpState expected = PumpState::kIdle;
  return state_.compare_exchange_strong(expected, PumpState::kRunning,
                                        std::memory_order_acq_rel);
}

bool PacingPump::Start() {
  if (!TryBegin()) {
    return false;
  }
  pump_thread_ = std::thread(&PacingPump::RunPass, this);
  return true;
}

PumpState PacingPump::Run() {
  if (!TryBegin()) {
    return PumpState::kIdle;
  }
  RunPass();
  return GetState();
}

void PacingPump::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  clock_->Interrupt();

  if (pump_thread_.joinable() && pump_thread_.get_id() != std::this_thread::get_id()) {
    pump_thread_.join();
  }
}

bool PacingPump::WaitForFinish(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(finish_mutex_);
  return finish_cv_.wait_for(lock, timeout, [this] { return finished_; });
}

void PacingPump::RunPass() {
  Slot slot = pool_.Acquire();
  clock_->Start();

  {
    std::ostringstream oss;
    oss << "[PacingPump] Pass started: slice_size=" << slot.capacity()
        << " interval_ms="
        << std::chrono::duration_cast<std::chrono::milliseconds>(clock_->Interval()).count()
        << " pacing=" << PacingModeToString(clock_->Mode());
    Logger::Info(oss.str());
  }

  int64_t slice_index = 0;
  PumpState final_state = PumpState::kCompleted;

  while (true) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      final_state = PumpState::kStopped;
      break;
    }

    payload::ReadResult read = reader_->Read(slot.data(), slot.capacity());

    if (read.status == payload::ReadStatus::kEnd) {
      break;
    }

    if (read.status == payload::ReadStatus::kError || read.bytes == 0) {
      // Best effort: retry the same cursor on the next iteration.
      uint64_t err_count = read_errors_.fetch_add(1, std::memory_order_relaxed);
      if ((err_count & 0xFF) == 0) {
        Logger::Warn("[PacingPump] Payload read error (count=" +
                     std::to_string(err_count + 1) + "): " +
                     (read.error.empty() ? "no bytes read" : read.error));
      }
      continue;
    }

    if (slice_index > 0 && !clock_->WaitForSlice(slice_index)) {
      final_state = PumpState::kStopped;
      break;
    }

    BroadcastResult result = registry_.Broadcast(slot.data(), read.bytes);
    slices_emitted_.fetch_add(1, std::memory_order_relaxed);
    bytes_emitted_.fetch_add(read.bytes, std::memory_order_relaxed);

    if (result.dropped > 0) {
      std::ostringstream oss;
      oss << "[PacingPump] slice=" << slice_index << " bytes=" << read.bytes
          << " delivered=" << result.delivered << " dropped=" << result.dropped;
      Logger::Debug(oss.str());
    }
    ++slice_index;
  }

  slot.Release();
  Finish(final_state);
}

void PacingPump::Finish(PumpState final_state) {
  state_.store(final_state, std::memory_order_release);

  std::ostringstream oss;
  oss << "[PacingPump] Pass " << PumpStateToString(final_state)
      << ": slices=" << slices_emitted_.load(std::memory_order_relaxed)
      << " bytes=" << bytes_emitted_.load(std::memory_order_relaxed)
      << " read_errors=" << read_errors_.load(std::memory_order_relaxed);
  Logger::Info(oss.str());

  if (finished_callback_) {
    finished_callback_(final_state);
  }

  {
    std::lock_guard<std::mutex> lock(finish_mutex_);
    finished_ = true;
  }
  finish_cv_.notify_all();
}

}  // namespace wavecast::broadcast
