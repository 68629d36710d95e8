// Repository: wavecast
// Component: SlotBufferPool
// Purpose: Free-list of fixed-size byte buffers reused by the pump loop.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/SlotBufferPool.hpp"

#include <stdexcept>
#include <utility>

namespace wavecast::broadcast {

Slot::Slot(SlotBufferPool* pool, std::vector<uint8_t> buffer)
    : pool_(pool), buffer_(std::move(buffer)) {}

Slot::~Slot() {
  Release();
}

Slot::Slot(Slot&& other) noexcept
    : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
  other.pool_ = nullptr;
}

Slot& Slot::operator=(Slot&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    buffer_ = std::move(other.buffer_);
    other.pool_ = nullptr;
  }
  return *this;
}

void Slot::Release() {
  if (pool_ == nullptr) return;
  SlotBufferPool* pool = pool_;
  pool_ = nullptr;
  pool->Return(std::move(buffer_));
  buffer_.clear();
}

SlotBufferPool::SlotBufferPool(size_t slot_size, size_t max_idle)
    : slot_size_(slot_size), max_idle_(max_idle) {
  if (slot_size_ == 0) {
    throw std::invalid_argument("SlotBufferPool requires a non-zero slot size");
  }
}

Slot SlotBufferPool::Acquire() {
  std::vector<uint8_t> buffer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!idle_.empty()) {
      buffer = std::move(idle_.back());
      idle_.pop_back();
    } else {
      ++allocated_;
    }
    ++outstanding_;
  }
  // Allocation happens outside the lock.
  if (buffer.size() != slot_size_) {
    buffer.assign(slot_size_, 0);
  }
  return Slot(this, std::move(buffer));
}

void SlotBufferPool::Return(std::vector<uint8_t> buffer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (outstanding_ > 0) --outstanding_;
  if (idle_.size() < max_idle_ && buffer.size() == slot_size_) {
    idle_.push_back(std::move(buffer));
  }
}

size_t SlotBufferPool::IdleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

size_t SlotBufferPool::OutstandingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_;
}

uint64_t SlotBufferPool::AllocatedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocated_;
}

}  // namespace wavecast::broadcast
