// Repository: wavecast
// Component: SocketByteSink Implementation
// Purpose: Byte sink over a connected stream socket, with optional HTTP/1.1
//          chunk framing and a bounded write stall.
// Copyright (c) 2025 wavecast

#include "wavecast/output/SocketByteSink.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "wavecast/output/SinkDiagnostics.h"

namespace wavecast::output {

namespace {

constexpr int kPollTimeoutMs = 100;  // Check for interrupt every 100ms
constexpr char kCrlf[] = "\r\n";
constexpr char kLastChunk[] = "0\r\n\r\n";

}  // namespace

SocketByteSink::SocketByteSink(int fd, std::string name,
                               std::chrono::milliseconds write_timeout)
    : fd_(fd), name_(std::move(name)), write_timeout_(write_timeout) {}

SocketByteSink::~SocketByteSink() {
  Close();
  ForgetWriteFailure(this);
}

bool SocketByteSink::Write(const uint8_t* data, size_t len) {
  if (closed_.load(std::memory_order_acquire) ||
      failed_.load(std::memory_order_acquire) ||
      interrupted_.load(std::memory_order_acquire)) {
    return false;
  }
  if (data == nullptr || len == 0) {
    return true;
  }

  if (framing_ == Framing::kHttpChunked) {
    char size_line[32];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
    pending_.insert(pending_.end(), size_line, size_line + n);
    pending_.insert(pending_.end(), data, data + len);
    pending_.insert(pending_.end(), kCrlf, kCrlf + 2);
  } else {
    pending_.insert(pending_.end(), data, data + len);
  }
  return true;
}

bool SocketByteSink::WriteString(const std::string& text) {
  return Write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool SocketByteSink::Flush() {
  if (fd_closed_ ||
      failed_.load(std::memory_order_acquire) ||
      interrupted_.load(std::memory_order_acquire)) {
    pending_.clear();
    return false;
  }
  if (pending_.empty()) {
    return true;
  }
  bool ok = SendAll(pending_.data(), pending_.size());
  pending_.clear();
  return ok;
}

bool SocketByteSink::SendAll(const uint8_t* data, size_t len) {
  const uint8_t* ptr = data;
  size_t remaining = len;
  auto last_progress = std::chrono::steady_clock::now();

  while (remaining > 0) {
    if (interrupted_.load(std::memory_order_acquire)) {
      MarkFailed("interrupted");
      return false;
    }
    if (std::chrono::steady_clock::now() - last_progress > write_timeout_) {
      MarkFailed("write stalled for " + std::to_string(write_timeout_.count()) + "ms");
      return false;
    }

    // Poll for writability with timeout
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int poll_ret = poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      MarkFailed(std::string("poll: ") + std::strerror(errno));
      return false;
    }
    if (poll_ret == 0) {
      // Timeout - check interrupt/stall and retry
      continue;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      MarkFailed("peer hangup or socket error");
      return false;
    }

    ssize_t n = send(fd_, ptr, remaining, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;  // Retry
      }
      MarkFailed(std::string("send: ") + std::strerror(errno));
      return false;
    }

    ptr += n;
    remaining -= static_cast<size_t>(n);
    bytes_sent_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
    last_progress = std::chrono::steady_clock::now();
  }
  return true;
}

void SocketByteSink::MarkFailed(const std::string& detail) {
  write_errors_.fetch_add(1, std::memory_order_relaxed);
  failed_.store(true, std::memory_order_release);
  if (!interrupted_.load(std::memory_order_acquire)) {
    LogFirstWriteFailure(OutputKind::kSocket, fd_, this, name_, detail);
  }
}

void SocketByteSink::Interrupt() {
  interrupted_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (!fd_closed_ && fd_ >= 0) {
    // Wakes a poll() in progress; the fd itself stays valid until Close().
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void SocketByteSink::Close() {
  // Idempotent close
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;  // Already closed
  }

  // Terminate the chunked body cleanly when the peer is still reachable.
  if (framing_ == Framing::kHttpChunked &&
      !failed_.load(std::memory_order_acquire) &&
      !interrupted_.load(std::memory_order_acquire)) {
    pending_.insert(pending_.end(), kLastChunk, kLastChunk + sizeof(kLastChunk) - 1);
    Flush();
  }
  pending_.clear();

  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (fd_closed_ || fd_ < 0) {
    return;
  }
  fd_closed_ = true;
  ::shutdown(fd_, SHUT_WR);  // Signal EOF to peer
  CLOSE_FD(fd_, "SocketByteSink::Close");
}

}  // namespace wavecast::output
