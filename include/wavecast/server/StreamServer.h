// Repository: wavecast
// Component: StreamServer
// Purpose: HTTP/1.x listener. Each accepted connection becomes one
//          ConsumerSession on its own thread.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_SERVER_STREAM_SERVER_H_
#define WAVECAST_SERVER_STREAM_SERVER_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "wavecast/broadcast/ConsumerRegistry.hpp"
#include "wavecast/output/ConsumerSession.h"
#include "wavecast/output/SocketByteSink.h"

namespace wavecast::server {

struct StreamServerConfig {
  std::string bind_address = "0.0.0.0";
  uint16_t port = 8080;  // 0 = ephemeral, see GetPort()
  std::string content_type = "application/octet-stream";
  size_t queue_capacity = broadcast::kDefaultConsumerQueueCapacity;
  size_t max_connections = 0;  // concurrent streams, 0 = unlimited
  std::chrono::milliseconds write_timeout = output::kDefaultWriteTimeout;
  std::chrono::milliseconds request_timeout{5000};
};

struct HttpRequestHead {
  std::string method;
  std::string target;
  std::string version;  // "HTTP/1.0" or "HTTP/1.1"
};

enum class RequestHeadStatus {
  kComplete,
  kTooLarge,  // no blank line within the first 8 KiB
  kFailed,    // timeout, peer close, socket error, or Stop()
};

// Parses the request line of a request head ("GET / HTTP/1.1\r\n...").
// Returns false for anything that is not a three-token HTTP/1.x line.
bool ParseRequestHead(const std::string& head, HttpRequestHead* out);

// StreamServer serves the broadcast on every path:
//
//   GET     → 200, stream headers, then one write per delivered slice
//             (one chunk each for HTTP/1.1, close-delimited for HTTP/1.0)
//   other   → 405
//   garbage → 400
//   head over 8 KiB → 431
//   registry closed or max_connections reached → 503
//
// The accept loop polls the listening socket every 100 ms so Stop() is
// prompt. Stop() closes the listener, closes every live session, and joins
// all connection threads.
class StreamServer {
 public:
  StreamServer(broadcast::ConsumerRegistry& registry, StreamServerConfig config);
  ~StreamServer();

  StreamServer(const StreamServer&) = delete;
  StreamServer& operator=(const StreamServer&) = delete;

  // Binds, listens and starts the accept thread.
  // Returns false (and logs the reason) if the socket cannot be set up.
  bool Start();

  // Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Port actually bound (resolves port 0). 0 before Start().
  uint16_t GetPort() const { return bound_port_; }

  size_t GetActiveStreams() const { return active_streams_.load(std::memory_order_relaxed); }
  uint64_t GetConnectionsAccepted() const { return connections_accepted_.load(std::memory_order_relaxed); }

 private:
  struct Connection {
    std::thread thread;
    std::atomic<bool> done{false};
    std::mutex mutex;
    output::ConsumerSession* session = nullptr;  // live while streaming
  };

  bool InitializeSocket();
  void AcceptLoop();
  void ReapFinished();
  void HandleConnection(Connection* connection, int fd, std::string peer);
  void ServeStream(Connection* connection, std::unique_ptr<output::SocketByteSink> sink,
                   const HttpRequestHead& request);
  RequestHeadStatus ReadRequestHead(int fd, std::string* head);

  broadcast::ConsumerRegistry& registry_;
  const StreamServerConfig config_;

  int listen_fd_ = -1;
  uint16_t bound_port_ = 0;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread accept_thread_;

  std::mutex connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_;

  std::atomic<size_t> active_streams_{0};
  std::atomic<uint64_t> connections_accepted_{0};
};

}  // namespace wavecast::server

#endif  // WAVECAST_SERVER_STREAM_SERVER_H_
