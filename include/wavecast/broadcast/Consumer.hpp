// Repository: wavecast
// Component: Consumer
// Purpose: One connected recipient of the broadcast: identity + queue.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_BROADCAST_CONSUMER_HPP_
#define WAVECAST_BROADCAST_CONSUMER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "wavecast/broadcast/ConsumerQueue.hpp"

namespace wavecast::broadcast {

// A Consumer is owned by exactly one lifecycle adapter (ConsumerSession or a
// test). ConsumerRegistry holds a non-owning pointer between Add and Remove;
// the owner must Remove before destroying the Consumer.
class Consumer {
 public:
  explicit Consumer(std::string name,
                    size_t queue_capacity = kDefaultConsumerQueueCapacity);

  Consumer(const Consumer&) = delete;
  Consumer& operator=(const Consumer&) = delete;

  // Process-unique, assigned at construction, never reused.
  uint64_t Id() const { return id_; }
  const std::string& Name() const { return name_; }

  ConsumerQueue& Queue() { return queue_; }
  const ConsumerQueue& Queue() const { return queue_; }

 private:
  const uint64_t id_;
  const std::string name_;
  ConsumerQueue queue_;
};

}  // namespace wavecast::broadcast

#endif  // WAVECAST_BROADCAST_CONSUMER_HPP_
