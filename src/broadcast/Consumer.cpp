// Repository: wavecast
// Component: Consumer
// Purpose: One connected recipient of the broadcast: identity + queue.
// Copyright (c) 2025 wavecast

#include "wavecast/broadcast/Consumer.hpp"

#include <atomic>
#include <utility>

namespace wavecast::broadcast {

namespace {
std::atomic<uint64_t> g_next_consumer_id{1};
}  // namespace

Consumer::Consumer(std::string name, size_t queue_capacity)
    : id_(g_next_consumer_id.fetch_add(1, std::memory_order_relaxed)),
      name_(std::move(name)),
      queue_(queue_capacity) {}

}  // namespace wavecast::broadcast
