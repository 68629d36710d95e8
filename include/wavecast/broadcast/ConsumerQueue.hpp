// Repository: wavecast
// Component: ConsumerQueue
// Purpose: Small bounded delivery channel owned by one consumer.
//          Non-blocking ingress, blocking egress, close unblocks egress.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_CONSUMER_QUEUE_HPP_
#define WAVECAST_BROADCAST_CONSUMER_QUEUE_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace wavecast::broadcast {

// One delivered slice. Copied on send, so the receiver owns it outright.
using SliceBytes = std::vector<uint8_t>;

// Pacing emits at most one slice per interval, so one slot is enough for a
// consumer that keeps up.
inline constexpr size_t kDefaultConsumerQueueCapacity = 1;

// ConsumerQueue is a bounded FIFO of slices.
//
// Producer side (pump thread, via ConsumerRegistry::Broadcast):
//   TrySend() copies the bytes and NEVER blocks. A full or closed queue
//   rejects the slice; the caller treats that as a drop.
//
// Consumer side (the session thread that owns the consumer):
//   Receive() blocks until a slice is available or the queue is closed.
//   Slices queued before Close() are still handed out; once the queue is
//   closed and empty, Receive() returns std::nullopt without blocking.
//
// Thread safety: all public methods are mutex-protected.
class ConsumerQueue {
 public:
  // Capacity 0 means unbounded.
  static constexpr size_t kUnbounded = 0;

  explicit ConsumerQueue(size_t capacity = kDefaultConsumerQueueCapacity);

  ConsumerQueue(const ConsumerQueue&) = delete;
  ConsumerQueue& operator=(const ConsumerQueue&) = delete;

  // --- Producer ---

  // Returns true if the slice was accepted, false if full or closed.
  bool TrySend(const uint8_t* data, size_t len);

  // --- Consumer ---

  std::optional<SliceBytes> Receive();

  // Non-blocking variant. std::nullopt when empty.
  std::optional<SliceBytes> TryReceive();

  // --- Lifecycle ---

  // Terminal: rejects further TrySend() and wakes every pending Receive().
  // Idempotent.
  void Close();
  bool IsClosed() const;

  // --- Observability ---

  size_t Capacity() const { return capacity_; }
  size_t Depth() const;
  uint64_t AcceptedCount() const;
  // Slices rejected because the queue was full (not counting closed).
  uint64_t DroppedCount() const;

 private:
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable ready_cv_;
  std::deque<SliceBytes> slices_;
  bool closed_ = false;

  uint64_t accepted_ = 0;
  uint64_t dropped_ = 0;
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_CONSUMER_QUEUE_HPP_
