// Repository: wavecast
// Component: ConsumerRegistry
// Purpose: Thread-safe set of live consumers with non-blocking fan-out
//          and drop-on-full backpressure.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/ConsumerRegistry.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "wavecast/util/Logger.hpp"

namespace wavecast::broadcast {

using util::Logger;

ConsumerRegistry::ConsumerRegistry() = default;

ConsumerRegistry::~ConsumerRegistry() {
  // Owners should have removed their consumers already; closing here only
  // guarantees no receiver is left waiting on a dead registry.
  CloseAll();
}

bool ConsumerRegistry::Add(Consumer* consumer) {
  if (consumer == nullptr) {
    return false;
  }

  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (!consumers_.insert(consumer).second) {
      return false;
    }
    count = consumers_.size();
  }

  std::ostringstream oss;
  oss << "[ConsumerRegistry] Added consumer id=" << consumer->Id()
      << " name=" << consumer->Name() << " consumers=" << count;
  Logger::Debug(oss.str());
  return true;
}

bool ConsumerRegistry::Remove(Consumer* consumer) {
  if (consumer == nullptr) {
    return false;
  }

  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumers_.erase(consumer) == 0) {
      return false;
    }
    count = consumers_.size();
    // Close under the lock: once Remove returns, no Broadcast can reach the
    // queue and its receiver has been woken.
    consumer->Queue().Close();
  }

  std::ostringstream oss;
  oss << "[ConsumerRegistry] Removed consumer id=" << consumer->Id()
      << " name=" << consumer->Name() << " consumers=" << count;
  Logger::Debug(oss.str());
  return true;
}

BroadcastResult ConsumerRegistry::Broadcast(const uint8_t* data, size_t len) {
  BroadcastResult result;
  if (data == nullptr || len == 0) {
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Consumer* consumer : consumers_) {
      if (consumer->Queue().TrySend(data, len)) {
        ++result.delivered;
      } else {
        // Queue full: skip this consumer rather than block the fan-out.
        ++result.dropped;
        if (drop_callback_) {
          drop_callback_(*consumer, len);
        }
      }
    }
  }

  slices_broadcast_.fetch_add(1, std::memory_order_relaxed);
  deliveries_.fetch_add(result.delivered, std::memory_order_relaxed);
  drops_.fetch_add(result.dropped, std::memory_order_relaxed);
  return result;
}

void ConsumerRegistry::CloseAll() {
  std::vector<Consumer*> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ && consumers_.empty()) {
      return;
    }
    closed_ = true;
    removed.assign(consumers_.begin(), consumers_.end());
    for (Consumer* consumer : removed) {
      consumer->Queue().Close();
    }
    consumers_.clear();
  }

  if (!removed.empty()) {
    Logger::Info("[ConsumerRegistry] Closed; released " +
                 std::to_string(removed.size()) + " consumer(s)");
  }
}

bool ConsumerRegistry::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ConsumerRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consumers_.size();
}

void ConsumerRegistry::SetDropCallback(DropCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  drop_callback_ = std::move(callback);
}

}  // namespace wavecast::broadcast
