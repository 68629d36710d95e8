// Repository: wavecast
// Component: SlotBufferPool
// Purpose: Free-list of fixed-size byte buffers reused by the pump loop.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_SLOT_BUFFER_POOL_HPP_
#define WAVECAST_BROADCAST_SLOT_BUFFER_POOL_HPP_

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace wavecast::broadcast {

class SlotBufferPool;

// Slot is a move-only checkout of one pool buffer. Exactly one Slot owns a
// given buffer at any time; the buffer returns to the pool when the Slot is
// destroyed or Release() is called.
class Slot {
 public:
  Slot() = default;
  ~Slot();

  Slot(Slot&& other) noexcept;
  Slot& operator=(Slot&& other) noexcept;

  Slot(const Slot&) = delete;
  Slot& operator=(const Slot&) = delete;

  uint8_t* data() { return buffer_.data(); }
  const uint8_t* data() const { return buffer_.data(); }
  size_t capacity() const { return buffer_.size(); }
  bool valid() const { return pool_ != nullptr; }

  // Returns the buffer to the pool early. Idempotent.
  void Release();

 private:
  friend class SlotBufferPool;
  Slot(SlotBufferPool* pool, std::vector<uint8_t> buffer);

  SlotBufferPool* pool_ = nullptr;
  std::vector<uint8_t> buffer_;
};

// SlotBufferPool hands out fixed-size buffers without allocating on the
// steady-state path. Acquire() reuses an idle buffer when one exists and
// allocates otherwise; returned buffers are kept up to max_idle.
//
// The pool must outlive every Slot it hands out.
// Thread safety: all public methods are mutex-protected.
class SlotBufferPool {
 public:
  explicit SlotBufferPool(size_t slot_size, size_t max_idle = 4);

  SlotBufferPool(const SlotBufferPool&) = delete;
  SlotBufferPool& operator=(const SlotBufferPool&) = delete;

  Slot Acquire();

  size_t SlotSize() const { return slot_size_; }
  size_t IdleCount() const;
  size_t OutstandingCount() const;

  // Buffers allocated over the pool's lifetime (reuse keeps this flat).
  uint64_t AllocatedCount() const;

 private:
  friend class Slot;
  void Return(std::vector<uint8_t> buffer);

  const size_t slot_size_;
  const size_t max_idle_;

  mutable std::mutex mutex_;
  std::vector<std::vector<uint8_t>> idle_;
  size_t outstanding_ = 0;
  uint64_t allocated_ = 0;
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_SLOT_BUFFER_POOL_HPP_
