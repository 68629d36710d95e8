// Repository: wavecast
// Component: StreamServer Implementation
// Purpose: HTTP/1.x listener. Each accepted connection becomes one
//          ConsumerSession on its own thread.
// Copyright (c) 2025 wavecast

#include "wavecast/server/StreamServer.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "wavecast/output/SinkDiagnostics.h"
#include "wavecast/util/Logger.hpp"

namespace wavecast::server {

using util::Logger;

namespace {

constexpr int kPollTimeoutMs = 100;  // Check for stop every 100ms
constexpr int kListenBacklog = 64;
constexpr size_t kMaxRequestHeadBytes = 8192;

std::string PeerName(const struct sockaddr_in& addr) {
  char host[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host)) == nullptr) {
    return "unknown";
  }
  return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
}

std::string StatusResponse(const std::string& version, int code, const char* reason,
                           const char* extra_headers = "") {
  std::ostringstream oss;
  oss << version << " " << code << " " << reason << "\r\n"
      << extra_headers
      << "Content-Length: 0\r\n"
      << "Connection: close\r\n"
      << "\r\n";
  return oss.str();
}

// Finishes a connection that will not stream.
void Reject(output::SocketByteSink& sink, const std::string& response) {
  if (!sink.WriteString(response) || !sink.Flush()) {
    Logger::Debug("[StreamServer] " + sink.GetName() + " gone before rejection was sent");
  }
}

}  // namespace

bool ParseRequestHead(const std::string& head, HttpRequestHead* out) {
  size_t line_end = head.find("\r\n");
  if (line_end == std::string::npos) {
    line_end = head.find('\n');
  }
  const std::string line = head.substr(0, line_end);

  std::istringstream iss(line);
  HttpRequestHead parsed;
  std::string trailing;
  if (!(iss >> parsed.method >> parsed.target >> parsed.version) || (iss >> trailing)) {
    return false;
  }
  if (parsed.version != "HTTP/1.0" && parsed.version != "HTTP/1.1") {
    return false;
  }
  if (parsed.target.empty() || (parsed.target[0] != '/' && parsed.target != "*")) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

StreamServer::StreamServer(broadcast::ConsumerRegistry& registry, StreamServerConfig config)
    : registry_(registry), config_(std::move(config)) {}

StreamServer::~StreamServer() {
  Stop();
}

bool StreamServer::InitializeSocket() {
  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    Logger::Error(std::string("[StreamServer] socket() failed: ") + std::strerror(errno));
    return false;
  }

  // Set socket options
  int opt = 1;
  if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    Logger::Warn(std::string("[StreamServer] SO_REUSEADDR failed: ") + std::strerror(errno));
  }

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
    Logger::Error("[StreamServer] Invalid bind address: " + config_.bind_address);
    CLOSE_FD(listen_fd_, "invalid bind address");
    listen_fd_ = -1;
    return false;
  }

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    Logger::Error("[StreamServer] bind(" + config_.bind_address + ":" +
                  std::to_string(config_.port) + ") failed: " + std::strerror(errno));
    CLOSE_FD(listen_fd_, "bind failed");
    listen_fd_ = -1;
    return false;
  }

  if (listen(listen_fd_, kListenBacklog) < 0) {
    Logger::Error(std::string("[StreamServer] listen() failed: ") + std::strerror(errno));
    CLOSE_FD(listen_fd_, "listen failed");
    listen_fd_ = -1;
    return false;
  }

  struct sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = config_.port;
  }

  // Set non-blocking
  int flags = fcntl(listen_fd_, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);
  }
  return true;
}

bool StreamServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }
  if (!InitializeSocket()) {
    running_.store(false, std::memory_order_release);
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);
  accept_thread_ = std::thread(&StreamServer::AcceptLoop, this);

  Logger::Info("[StreamServer] Listening on " + config_.bind_address + ":" +
               std::to_string(bound_port_) + " content_type=" + config_.content_type);
  return true;
}

void StreamServer::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  stop_requested_.store(true, std::memory_order_release);

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    CLOSE_FD(listen_fd_, "StreamServer::Stop");
    listen_fd_ = -1;
  }

  // No new connections can appear now; close live sessions, then join.
  std::list<std::unique_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections.swap(connections_);
  }
  for (auto& connection : connections) {
    std::lock_guard<std::mutex> lock(connection->mutex);
    if (connection->session != nullptr) {
      connection->session->Close();
    }
  }
  for (auto& connection : connections) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }

  Logger::Info("[StreamServer] Stopped: connections_accepted=" +
               std::to_string(connections_accepted_.load(std::memory_order_relaxed)));
}

void StreamServer::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    ReapFinished();

    struct pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_ret = poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      Logger::Error(std::string("[StreamServer] poll() failed: ") + std::strerror(errno));
      break;
    }
    if (poll_ret == 0) {
      continue;
    }

    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                           &client_len);
    if (client_fd < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
          errno == ECONNABORTED) {
        continue;
      }
      Logger::Warn(std::string("[StreamServer] accept() failed: ") + std::strerror(errno));
      continue;
    }

    connections_accepted_.fetch_add(1, std::memory_order_relaxed);

    auto connection = std::make_unique<Connection>();
    Connection* raw = connection.get();
    std::string peer = PeerName(client_addr);
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connections_.push_back(std::move(connection));
      raw->thread = std::thread(&StreamServer::HandleConnection, this, raw, client_fd,
                                std::move(peer));
    }
  }
}

void StreamServer::ReapFinished() {
  std::list<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if ((*it)->done.load(std::memory_order_acquire)) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }
}

RequestHeadStatus StreamServer::ReadRequestHead(int fd, std::string* head) {
  const auto deadline = std::chrono::steady_clock::now() + config_.request_timeout;
  char buf[1024];

  while (!stop_requested_.load(std::memory_order_acquire)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return RequestHeadStatus::kFailed;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_ret = poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      return RequestHeadStatus::kFailed;
    }
    if (poll_ret == 0) {
      continue;
    }

    ssize_t n = recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return RequestHeadStatus::kFailed;
    }
    if (n == 0) {
      return RequestHeadStatus::kFailed;  // Peer closed before finishing the request
    }

    head->append(buf, static_cast<size_t>(n));
    if (head->find("\r\n\r\n") != std::string::npos ||
        head->find("\n\n") != std::string::npos) {
      return RequestHeadStatus::kComplete;
    }
    if (head->size() > kMaxRequestHeadBytes) {
      return RequestHeadStatus::kTooLarge;
    }
  }
  return RequestHeadStatus::kFailed;
}

void StreamServer::HandleConnection(Connection* connection, int fd, std::string peer) {
  std::string head;
  const RequestHeadStatus status = ReadRequestHead(fd, &head);
  if (status == RequestHeadStatus::kFailed) {
    Logger::Debug("[StreamServer] " + peer + " sent no complete request");
    CLOSE_FD(fd, "incomplete request");
    connection->done.store(true, std::memory_order_release);
    return;
  }

  auto sink = std::make_unique<output::SocketByteSink>(fd, peer, config_.write_timeout);

  HttpRequestHead request;
  if (status == RequestHeadStatus::kTooLarge) {
    Logger::Debug("[StreamServer] " + peer + " request head exceeds " +
                  std::to_string(kMaxRequestHeadBytes) + " bytes");
    Reject(*sink, StatusResponse("HTTP/1.1", 431, "Request Header Fields Too Large"));
  } else if (!ParseRequestHead(head, &request)) {
    Reject(*sink, StatusResponse("HTTP/1.1", 400, "Bad Request"));
  } else if (request.method != "GET") {
    Reject(*sink, StatusResponse(request.version, 405, "Method Not Allowed", "Allow: GET\r\n"));
  } else {
    ServeStream(connection, std::move(sink), request);
  }

  connection->done.store(true, std::memory_order_release);
}

void StreamServer::ServeStream(Connection* connection,
                               std::unique_ptr<output::SocketByteSink> sink,
                               const HttpRequestHead& request) {
  output::SocketByteSink* socket_sink = sink.get();
  const std::string peer = socket_sink->GetName();

  if (config_.max_connections > 0 &&
      active_streams_.fetch_add(1, std::memory_order_acq_rel) >= config_.max_connections) {
    active_streams_.fetch_sub(1, std::memory_order_acq_rel);
    Logger::Warn("[StreamServer] " + peer + " refused: max_connections=" +
                 std::to_string(config_.max_connections) + " reached");
    Reject(*socket_sink, StatusResponse(request.version, 503, "Service Unavailable"));
    return;
  }
  if (config_.max_connections == 0) {
    active_streams_.fetch_add(1, std::memory_order_acq_rel);
  }

  {
    output::ConsumerSession session(registry_, std::move(sink), config_.queue_capacity);

    if (!session.Open()) {
      Logger::Info("[StreamServer] " + peer + " refused: broadcast is not accepting listeners");
      Reject(*socket_sink, StatusResponse(request.version, 503, "Service Unavailable"));
    } else {
      {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->session = &session;
      }
      // Stop() may have swept the connections before the pointer was set.
      if (stop_requested_.load(std::memory_order_acquire)) {
        session.Close();
      }

      const bool chunked = request.version == "HTTP/1.1";
      std::ostringstream response;
      response << request.version << " 200 OK\r\n"
               << "Content-Type: " << config_.content_type << "\r\n"
               << "Connection: " << (chunked ? "keep-alive" : "close") << "\r\n"
               << "Cache-Control: no-cache\r\n";
      if (chunked) {
        response << "Transfer-Encoding: chunked\r\n";
      }
      response << "\r\n";

      if (socket_sink->WriteString(response.str()) && socket_sink->Flush()) {
        if (chunked) {
          socket_sink->SetFraming(output::Framing::kHttpChunked);
        }
        Logger::Info("[StreamServer] " + peer + " has connected to the stream (" +
                     request.method + " " + request.target + ")");
        session.Run();
      }

      std::lock_guard<std::mutex> lock(connection->mutex);
      connection->session = nullptr;
    }
  }  // session destroyed: deregistered, sink closed

  active_streams_.fetch_sub(1, std::memory_order_acq_rel);
}

}  // namespace wavecast::server
