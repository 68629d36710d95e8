// Repository: wavecast
// Component: ConsumerRegistry
// Purpose: Thread-safe set of live consumers with non-blocking fan-out
//          and drop-on-full backpressure.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_CONSUMER_REGISTRY_HPP_
#define WAVECAST_BROADCAST_CONSUMER_REGISTRY_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_set>

#include "wavecast/broadcast/Consumer.hpp"

namespace wavecast::broadcast {

// Outcome of one fan-out.
struct BroadcastResult {
  size_t delivered = 0;  // consumers whose queue accepted the slice
  size_t dropped = 0;    // consumers whose queue was full or closed
};

// Invoked once per dropped delivery, under the registry lock.
// MUST NOT block and MUST NOT call back into the registry.
using DropCallback = std::function<void(const Consumer& consumer, size_t slice_bytes)>;

// ConsumerRegistry fans each slice out to every registered consumer.
//
// Core rules:
//   - A consumer is registered at most once (handle is the key).
//   - Broadcast is non-blocking per consumer: a full queue drops that slice
//     for that consumer only. Live continuity wins over completeness.
//   - Add, Remove and the iterate-and-send step of Broadcast are serialized
//     by one mutex. Consumers added after a Broadcast took the lock never see
//     that slice; consumers removed before it never see it either.
//   - Remove closes the consumer's queue, which unblocks its Receive().
//   - The lock is held for O(consumers) and never across a blocking call.
//
// The registry does not own consumers. Owners must Remove before destroying.
class ConsumerRegistry {
 public:
  ConsumerRegistry();
  ~ConsumerRegistry();

  ConsumerRegistry(const ConsumerRegistry&) = delete;
  ConsumerRegistry& operator=(const ConsumerRegistry&) = delete;

  // Returns false for nullptr, a duplicate, or after CloseAll().
  bool Add(Consumer* consumer);

  // Returns false if the consumer was not registered. Safe from any thread,
  // including concurrently for the same consumer.
  bool Remove(Consumer* consumer);

  BroadcastResult Broadcast(const uint8_t* data, size_t len);

  // Removes every consumer (closing their queues) and refuses later Adds.
  // Used for shutdown and at the end of the payload pass. Idempotent.
  void CloseAll();

  bool IsClosed() const;
  size_t Size() const;

  // Install before broadcasting begins; pass nullptr to clear.
  void SetDropCallback(DropCallback callback);

  // =========================================================================
  // DIAGNOSTICS
  // =========================================================================
  uint64_t GetSlicesBroadcast() const { return slices_broadcast_.load(std::memory_order_relaxed); }
  uint64_t GetDeliveries() const { return deliveries_.load(std::memory_order_relaxed); }
  uint64_t GetDrops() const { return drops_.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex mutex_;
  std::unordered_set<Consumer*> consumers_;
  bool closed_ = false;
  DropCallback drop_callback_;

  std::atomic<uint64_t> slices_broadcast_{0};
  std::atomic<uint64_t> deliveries_{0};
  std::atomic<uint64_t> drops_{0};
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_CONSUMER_REGISTRY_HPP_
