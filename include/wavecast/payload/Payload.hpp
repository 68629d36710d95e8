// Repository: wavecast
// Component: Payload
// Purpose: Immutable media payload, its cursor reader, and the file loader.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_PAYLOAD_PAYLOAD_HPP_
#define WAVECAST_PAYLOAD_PAYLOAD_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wavecast::payload {

inline constexpr const char* kDefaultContentType = "application/octet-stream";

// Payload is loaded once and never mutated. Shared read-only as
// std::shared_ptr<const Payload>.
class Payload {
 public:
  Payload(std::vector<uint8_t> bytes, std::string content_type, std::string source);

  const uint8_t* data() const { return bytes_.data(); }
  size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  // MIME type announced to HTTP clients.
  const std::string& content_type() const { return content_type_; }
  // File path or label, for logging.
  const std::string& source() const { return source_; }

 private:
  const std::vector<uint8_t> bytes_;
  const std::string content_type_;
  const std::string source_;
};

enum class ReadStatus {
  kOk,     // bytes > 0 were copied
  kEnd,    // cursor is at end of payload
  kError,  // transient fault; cursor unchanged, caller may retry
};

struct ReadResult {
  ReadStatus status = ReadStatus::kEnd;
  size_t bytes = 0;
  std::string error;
};

// Sequential reader consumed by PacingPump.
class IPayloadReader {
 public:
  virtual ~IPayloadReader() = default;

  // Copies up to capacity bytes from the cursor into dst and advances it.
  virtual ReadResult Read(uint8_t* dst, size_t capacity) = 0;
};

// Cursor over an in-memory Payload. Single-reader.
class PayloadReader : public IPayloadReader {
 public:
  // Throws std::invalid_argument on nullptr.
  explicit PayloadReader(std::shared_ptr<const Payload> payload);

  ReadResult Read(uint8_t* dst, size_t capacity) override;

  size_t Cursor() const { return cursor_; }
  size_t Remaining() const { return payload_->size() - cursor_; }

 private:
  std::shared_ptr<const Payload> payload_;
  size_t cursor_ = 0;
};

// Reads the whole file into memory.
// content_type_override: used verbatim when non-empty; otherwise the type is
// guessed from the file name (GuessContentType).
// Throws std::runtime_error if the file cannot be opened or read.
std::shared_ptr<const Payload> LoadPayloadFile(const std::string& path,
                                               const std::string& content_type_override = "");

// MIME type for a file name via libavformat's muxer table
// (".aac" → "audio/aac", ".mp3" → "audio/mpeg").
// Returns kDefaultContentType when nothing matches or FFmpeg is unavailable.
std::string GuessContentType(const std::string& path);

// Container format name detected from the leading bytes (e.g. "aac", "mp3").
// Empty when unknown or FFmpeg is unavailable. Diagnostics only.
std::string ProbeContainerFormat(const Payload& payload);

}  // namespace wavecast::payload

#endif  // WAVECAST_PAYLOAD_PAYLOAD_HPP_
