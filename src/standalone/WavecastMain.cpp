// Repository: wavecast
// Component: wavecast executable
// Purpose: Loads one media file and re-broadcasts it, paced, to every
//          connected HTTP client for a single pass.
// Copyright (c) 2025 wavecast

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <sstream>
#include <thread>

#include "wavecast/broadcast/ConsumerRegistry.hpp"
#include "wavecast/broadcast/PacingPump.hpp"
#include "wavecast/broadcast/PumpClock.hpp"
#include "wavecast/broadcast/SlotBufferPool.hpp"
#include "wavecast/payload/Payload.hpp"
#include "wavecast/runtime/BroadcastConfig.h"
#include "wavecast/server/StreamServer.h"
#include "wavecast/util/Logger.hpp"

namespace {

using wavecast::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

constexpr std::chrono::milliseconds kDrainGrace{2000};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

void InstallSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // Writes to a vanished client must fail with EPIPE, not kill the process.
  std::signal(SIGPIPE, SIG_IGN);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace wavecast;

  runtime::ParseResult args = runtime::ParseCommandLine(argc, argv);
  if (args.help) {
    runtime::PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    Logger::Error("[wavecast] " + args.error);
    runtime::PrintUsage(argv[0]);
    return 1;
  }
  const runtime::BroadcastConfig& config = args.config;
  Logger::Info("[wavecast] Starting: " + config.Describe());

  std::shared_ptr<const payload::Payload> content;
  try {
    content = payload::LoadPayloadFile(config.filename, config.content_type);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[wavecast] ") + e.what());
    return 1;
  }

  InstallSignalHandlers();

  // Drops are reported through the counters in the summary; no observer is
  // installed since it would run under the registry lock.
  broadcast::ConsumerRegistry registry;

  server::StreamServerConfig server_config;
  server_config.bind_address = config.bind_address;
  server_config.port = config.port;
  server_config.content_type = content->content_type();
  server_config.queue_capacity = config.queue_capacity;
  server_config.max_connections = config.max_connections;
  server_config.write_timeout = config.write_timeout;

  server::StreamServer server(registry, server_config);
  if (!server.Start()) {
    return 1;
  }

  broadcast::SlotBufferPool pool(config.slice_size);
  broadcast::PacingPump pump(
      registry, pool,
      std::make_unique<payload::PayloadReader>(content),
      std::make_unique<broadcast::PumpClock>(config.delay, config.pacing));

  std::atomic<bool> pass_finished{false};
  pump.SetFinishedCallback([&registry, &pass_finished](broadcast::PumpState) {
    // End of the single pass: release every listener with a clean end of stream.
    registry.CloseAll();
    pass_finished.store(true, std::memory_order_release);
  });

  if (!pump.Start()) {
    Logger::Error("[wavecast] Pump failed to start");
    server.Stop();
    return 1;
  }

  while (!g_termination_requested.load(std::memory_order_acquire) &&
         !pass_finished.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_termination_requested.load(std::memory_order_acquire)) {
    Logger::Info("[wavecast] Termination requested, shutting down");
  } else {
    // Let listeners flush the slices still queued for them.
    const auto drain_deadline = std::chrono::steady_clock::now() + kDrainGrace;
    while (server.GetActiveStreams() > 0 &&
           std::chrono::steady_clock::now() < drain_deadline &&
           !g_termination_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }

  pump.Stop();
  registry.CloseAll();
  server.Stop();

  std::ostringstream oss;
  oss << "[wavecast] Done: slices=" << pump.GetSlicesEmitted()
      << " bytes=" << pump.GetBytesEmitted()
      << " deliveries=" << registry.GetDeliveries()
      << " drops=" << registry.GetDrops()
      << " connections=" << server.GetConnectionsAccepted();
  Logger::Info(oss.str());
  return 0;
}
