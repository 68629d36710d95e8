// Repository: wavecast
// Component: ConsumerSession
// Purpose: Lifecycle adapter binding one transport sink to one consumer:
//          register once, drain the queue into the sink, deregister once.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_OUTPUT_CONSUMER_SESSION_H_
#define WAVECAST_OUTPUT_CONSUMER_SESSION_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "wavecast/broadcast/Consumer.hpp"
#include "wavecast/broadcast/ConsumerRegistry.hpp"
#include "wavecast/output/IByteSink.h"

namespace wavecast::output {

enum class SessionEndReason {
  kNotRegistered,  // Open() was not called or the registry refused it
  kQueueClosed,    // ended by Close() or registry CloseAll, even mid-write
  kWriteFailed,    // transport write or flush failed on its own
};

const char* SessionEndReasonToString(SessionEndReason reason);

// ConsumerSession owns a Consumer and the sink it drains into.
//
// Guarantees:
//   - Registration happens at most once (Open()).
//   - Deregistration happens exactly once if registration happened, on
//     every exit path: Run() returning, Close(), or destruction.
//   - A transport fault ends this session only. Nothing propagates to the
//     registry, the pump, or other consumers.
//
// Threading: Open() and Run() are called on the session's own thread.
// Close() may be called from any thread and unblocks Run().
class ConsumerSession {
 public:
  // Throws std::invalid_argument on a null sink.
  ConsumerSession(broadcast::ConsumerRegistry& registry,
                  std::unique_ptr<IByteSink> sink,
                  size_t queue_capacity = broadcast::kDefaultConsumerQueueCapacity);
  ~ConsumerSession();

  ConsumerSession(const ConsumerSession&) = delete;
  ConsumerSession& operator=(const ConsumerSession&) = delete;

  // Registers the consumer. Returns false if already opened or the registry
  // refused the consumer (registry closed).
  bool Open();

  // Receive → Write → Flush until the queue closes or the sink fails.
  // Deregisters before returning.
  SessionEndReason Run();

  // Deregisters (idempotent) and interrupts the sink. A slice caught
  // in flight is abandoned; Run() still reports kQueueClosed.
  void Close();

  bool IsRegistered() const { return registered_.load(std::memory_order_acquire); }

  IByteSink& Sink() { return *sink_; }
  broadcast::Consumer& GetConsumer() { return consumer_; }

  uint64_t GetSlicesWritten() const { return slices_written_.load(std::memory_order_relaxed); }
  uint64_t GetBytesWritten() const { return bytes_written_.load(std::memory_order_relaxed); }

 private:
  void Deregister();

  broadcast::ConsumerRegistry& registry_;
  std::unique_ptr<IByteSink> sink_;
  broadcast::Consumer consumer_;

  std::atomic<bool> opened_{false};
  std::atomic<bool> registered_{false};
  std::atomic<bool> closed_by_owner_{false};  // set before the sink is interrupted

  std::atomic<uint64_t> slices_written_{0};
  std::atomic<uint64_t> bytes_written_{0};
};

}  // namespace wavecast::output

#endif  // WAVECAST_OUTPUT_CONSUMER_SESSION_H_
