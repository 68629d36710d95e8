// Repository: wavecast
// Component: BroadcastConfig
// Purpose: Runtime settings for the wavecast executable and their
//          command-line parsing.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_RUNTIME_BROADCAST_CONFIG_H_
#define WAVECAST_RUNTIME_BROADCAST_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "wavecast/broadcast/PumpClock.hpp"

namespace wavecast::runtime {

struct BroadcastConfig {
  // Payload
  std::string filename = "file.aac";
  std::string content_type;  // empty = guess from filename

  // Pacing
  size_t slice_size = 8192;
  std::chrono::milliseconds delay{150};
  broadcast::PacingMode pacing = broadcast::PacingMode::kFixedRate;

  // Delivery
  size_t queue_capacity = 1;  // 0 = unbounded

  // Listener
  std::string bind_address = "0.0.0.0";
  uint16_t port = 8080;
  size_t max_connections = 0;  // 0 = unlimited
  std::chrono::milliseconds write_timeout{5000};

  // Returns false and fills *error on the first invalid setting.
  bool Validate(std::string* error) const;

  // One-line summary for the startup log.
  std::string Describe() const;
};

struct ParseResult {
  BroadcastConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

ParseResult ParseCommandLine(int argc, const char* const argv[]);

void PrintUsage(const char* program_name);

}  // namespace wavecast::runtime

#endif  // WAVECAST_RUNTIME_BROADCAST_CONFIG_H_
