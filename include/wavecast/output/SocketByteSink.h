// Repository: wavecast
// Component: SocketByteSink
// Purpose: Byte sink over a connected stream socket, with optional HTTP/1.1
//          chunk framing and a bounded write stall.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_OUTPUT_SOCKET_BYTE_SINK_H_
#define WAVECAST_OUTPUT_SOCKET_BYTE_SINK_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "wavecast/output/IByteSink.h"

namespace wavecast::output {

enum class Framing {
  kRaw,          // bytes as-is (response head, HTTP/1.0 close-delimited body)
  kHttpChunked,  // each Write() becomes one "<hex-len>\r\n<data>\r\n" chunk
};

inline constexpr std::chrono::milliseconds kDefaultWriteTimeout{5000};

// SocketByteSink writes to a connected socket owned by this object.
//
// Write() stages bytes; Flush() drains the staging buffer with
// poll() + send(MSG_NOSIGNAL | MSG_DONTWAIT) so a dead peer never raises
// SIGPIPE and a slow peer never blocks longer than write_timeout without
// progress. Any failure is latched: every later Write/Flush returns false.
//
// Failure is local. It ends this sink only; the caller decides what to tear
// down.
class SocketByteSink : public IByteSink {
 public:
  // fd: connected socket. SocketByteSink TAKES OWNERSHIP and will close it.
  SocketByteSink(int fd, std::string name,
                 std::chrono::milliseconds write_timeout = kDefaultWriteTimeout);
  ~SocketByteSink() override;

  SocketByteSink(const SocketByteSink&) = delete;
  SocketByteSink& operator=(const SocketByteSink&) = delete;

  // Applies to subsequent Write() calls. Switching to kRaw after chunks were
  // written ends nothing; Close() writes the terminating chunk if the sink is
  // in kHttpChunked mode.
  void SetFraming(Framing framing) { framing_ = framing; }
  Framing GetFraming() const { return framing_; }

  bool Write(const uint8_t* data, size_t len) override;
  bool Flush() override;
  void Interrupt() override;
  void Close() override;
  std::string GetName() const override { return name_; }

  // Convenience for the HTTP response head.
  bool WriteString(const std::string& text);

  bool HasFailed() const { return failed_.load(std::memory_order_acquire); }
  uint64_t GetBytesSent() const { return bytes_sent_.load(std::memory_order_relaxed); }
  uint64_t GetWriteErrors() const { return write_errors_.load(std::memory_order_relaxed); }

 private:
  bool SendAll(const uint8_t* data, size_t len);
  void MarkFailed(const std::string& detail);

  const int fd_;
  const std::string name_;
  const std::chrono::milliseconds write_timeout_;
  Framing framing_ = Framing::kRaw;

  std::vector<uint8_t> pending_;

  // Guards fd_ teardown against Interrupt() from another thread.
  std::mutex fd_mutex_;
  bool fd_closed_ = false;

  std::atomic<bool> closed_{false};
  std::atomic<bool> interrupted_{false};
  std::atomic<bool> failed_{false};

  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> write_errors_{0};
};

}  // namespace wavecast::output

#endif  // WAVECAST_OUTPUT_SOCKET_BYTE_SINK_H_
