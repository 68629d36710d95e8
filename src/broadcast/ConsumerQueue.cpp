// Repository: wavecast
// Component: ConsumerQueue
// Purpose: Small bounded delivery channel owned by one consumer.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/ConsumerQueue.hpp"

#include <utility>

namespace wavecast::broadcast {

ConsumerQueue::ConsumerQueue(size_t capacity) : capacity_(capacity) {}

bool ConsumerQueue::TrySend(const uint8_t* data, size_t len) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (capacity_ != kUnbounded && slices_.size() >= capacity_) {
      ++dropped_;
      return false;
    }
    if (data != nullptr && len > 0) {
      slices_.emplace_back(data, data + len);
    } else {
      slices_.emplace_back();
    }
    ++accepted_;
  }
  ready_cv_.notify_one();
  return true;
}

std::optional<SliceBytes> ConsumerQueue::Receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_cv_.wait(lock, [this] { return closed_ || !slices_.empty(); });
  if (slices_.empty()) {
    return std::nullopt;  // closed and drained
  }
  SliceBytes slice = std::move(slices_.front());
  slices_.pop_front();
  return slice;
}

std::optional<SliceBytes> ConsumerQueue::TryReceive() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slices_.empty()) {
    return std::nullopt;
  }
  SliceBytes slice = std::move(slices_.front());
  slices_.pop_front();
  return slice;
}

void ConsumerQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
  }
  ready_cv_.notify_all();
}

bool ConsumerQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ConsumerQueue::Depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slices_.size();
}

uint64_t ConsumerQueue::AcceptedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepted_;
}

uint64_t ConsumerQueue::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace wavecast::broadcast
