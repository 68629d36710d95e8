// Repository: wavecast
// Component: BroadcastConfig
// Purpose: Runtime settings for the wavecast executable and their
//          command-line parsing.
// Copyright (c) 2025 wavecast

#include "wavecast/runtime/BroadcastConfig.h"

#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wavecast::runtime {

namespace {

// Parses a non-negative decimal integer no larger than max.
bool ParseUnsigned(const std::string& text, uint64_t max, uint64_t* out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return false;
  }
  try {
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed, 10);
    if (consumed != text.size() || value > max) {
      return false;
    }
    *out = static_cast<uint64_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

bool BroadcastConfig::Validate(std::string* error) const {
  if (filename.empty()) {
    *error = "--filename must not be empty";
    return false;
  }
  if (slice_size == 0) {
    *error = "--slice-size must be greater than zero";
    return false;
  }
  if (delay.count() <= 0) {
    *error = "--delay-ms must be greater than zero";
    return false;
  }
  if (bind_address.empty()) {
    *error = "--bind must not be empty";
    return false;
  }
  if (write_timeout.count() <= 0) {
    *error = "--write-timeout-ms must be greater than zero";
    return false;
  }
  return true;
}

std::string BroadcastConfig::Describe() const {
  std::ostringstream oss;
  oss << "filename=" << filename
      << " slice_size=" << slice_size
      << " delay_ms=" << delay.count()
      << " pacing=" << broadcast::PacingModeToString(pacing)
      << " queue_capacity=" << queue_capacity
      << " listen=" << bind_address << ":" << port
      << " max_connections=" << max_connections
      << " write_timeout_ms=" << write_timeout.count();
  if (!content_type.empty()) {
    oss << " content_type=" << content_type;
  }
  return oss.str();
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Streams one media file, paced, to every connected HTTP client.\n"
            << "\n"
            << "PAYLOAD:\n"
            << "  --filename PATH         Media file to broadcast (default: file.aac)\n"
            << "  --content-type TYPE     Content-Type header (default: guessed from PATH)\n"
            << "\n"
            << "PACING:\n"
            << "  --slice-size BYTES      Bytes per broadcast slice (default: 8192)\n"
            << "  --delay-ms MS           Delay between slices (default: 150)\n"
            << "  --pacing MODE           fixed-rate | fixed-delay (default: fixed-rate)\n"
            << "\n"
            << "DELIVERY:\n"
            << "  --queue-capacity N      Slices buffered per client, 0 = unbounded (default: 1)\n"
            << "  --write-timeout-ms MS   Drop a client stalled this long (default: 5000)\n"
            << "\n"
            << "LISTENER:\n"
            << "  --bind ADDR             IPv4 listen address (default: 0.0.0.0)\n"
            << "  --port N                Listen port (default: 8080)\n"
            << "  --max-connections N     Concurrent streams, 0 = unlimited (default: 0)\n"
            << "\n"
            << "  --help                  Show this help message\n"
            << "\n"
            << "Set WAVECAST_DEBUG=1 for per-slice and per-connection debug logs.\n";
}

ParseResult ParseCommandLine(int argc, const char* const argv[]) {
  ParseResult result;
  BroadcastConfig& config = result.config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    uint64_t number = 0;

    if (arg == "--help" || arg == "-h") {
      result.help = true;
      result.valid = true;
      return result;
    } else if (arg == "--filename" && has_value) {
      config.filename = argv[++i];
    } else if (arg == "--content-type" && has_value) {
      config.content_type = argv[++i];
    } else if (arg == "--slice-size" && has_value) {
      if (!ParseUnsigned(argv[++i], std::numeric_limits<uint32_t>::max(), &number)) {
        result.error = "Invalid --slice-size: " + std::string(argv[i]);
        return result;
      }
      config.slice_size = static_cast<size_t>(number);
    } else if (arg == "--delay-ms" && has_value) {
      if (!ParseUnsigned(argv[++i], 24ULL * 60 * 60 * 1000, &number)) {
        result.error = "Invalid --delay-ms: " + std::string(argv[i]);
        return result;
      }
      config.delay = std::chrono::milliseconds(number);
    } else if (arg == "--pacing" && has_value) {
      if (!broadcast::ParsePacingMode(argv[++i], &config.pacing)) {
        result.error = "Invalid --pacing: " + std::string(argv[i]) +
                       " (expected fixed-rate or fixed-delay)";
        return result;
      }
    } else if (arg == "--queue-capacity" && has_value) {
      if (!ParseUnsigned(argv[++i], 1u << 20, &number)) {
        result.error = "Invalid --queue-capacity: " + std::string(argv[i]);
        return result;
      }
      config.queue_capacity = static_cast<size_t>(number);
    } else if (arg == "--write-timeout-ms" && has_value) {
      if (!ParseUnsigned(argv[++i], 24ULL * 60 * 60 * 1000, &number)) {
        result.error = "Invalid --write-timeout-ms: " + std::string(argv[i]);
        return result;
      }
      config.write_timeout = std::chrono::milliseconds(number);
    } else if (arg == "--bind" && has_value) {
      config.bind_address = argv[++i];
    } else if (arg == "--port" && has_value) {
      if (!ParseUnsigned(argv[++i], std::numeric_limits<uint16_t>::max(), &number)) {
        result.error = "Invalid --port: " + std::string(argv[i]);
        return result;
      }
      config.port = static_cast<uint16_t>(number);
    } else if (arg == "--max-connections" && has_value) {
      if (!ParseUnsigned(argv[++i], std::numeric_limits<uint32_t>::max(), &number)) {
        result.error = "Invalid --max-connections: " + std::string(argv[i]);
        return result;
      }
      config.max_connections = static_cast<size_t>(number);
    } else {
      result.error = "Unknown argument: " + arg;
      return result;
    }
  }

  if (!config.Validate(&result.error)) {
    return result;
  }

  result.valid = true;
  return result;
}

}  // namespace wavecast::runtime
