// Repository: wavecast
// Component: Payload
// Purpose: Immutable media payload, its cursor reader, and the file loader.
// Copyright (c) 2025 wavecast

#include "wavecast/payload/Payload.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "wavecast/util/Logger.hpp"

#ifdef WAVECAST_FFMPEG_AVAILABLE
extern "C" {
#include <libavformat/avformat.h>
}
#endif

namespace wavecast::payload {

using util::Logger;

namespace {

// av_probe_input_format looks at the leading bytes only.
constexpr size_t kProbeBytes = 4096;

}  // namespace

Payload::Payload(std::vector<uint8_t> bytes, std::string content_type, std::string source)
    : bytes_(std::move(bytes)),
      content_type_(std::move(content_type)),
      source_(std::move(source)) {}

PayloadReader::PayloadReader(std::shared_ptr<const Payload> payload)
    : payload_(std::move(payload)) {
  if (!payload_) {
    throw std::invalid_argument("PayloadReader requires a payload");
  }
}

ReadResult PayloadReader::Read(uint8_t* dst, size_t capacity) {
  ReadResult result;
  if (cursor_ >= payload_->size()) {
    result.status = ReadStatus::kEnd;
    return result;
  }
  if (dst == nullptr || capacity == 0) {
    result.status = ReadStatus::kError;
    result.error = "empty destination buffer";
    return result;
  }

  const size_t n = std::min(capacity, payload_->size() - cursor_);
  std::memcpy(dst, payload_->data() + cursor_, n);
  cursor_ += n;

  result.status = ReadStatus::kOk;
  result.bytes = n;
  return result;
}

std::shared_ptr<const Payload> LoadPayloadFile(const std::string& path,
                                               const std::string& content_type_override) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("LoadPayloadFile: cannot open " + path + ": " +
                             std::strerror(errno));
  }

  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error("LoadPayloadFile: read failed for " + path);
  }

  std::string content_type = content_type_override.empty()
                                 ? GuessContentType(path)
                                 : content_type_override;

  auto payload = std::make_shared<const Payload>(std::move(bytes), content_type, path);

  std::ostringstream oss;
  oss << "[Payload] Loaded " << path << " bytes=" << payload->size()
      << " content_type=" << payload->content_type();
  const std::string format = ProbeContainerFormat(*payload);
  if (!format.empty()) {
    oss << " probed_format=" << format;
  }
  Logger::Info(oss.str());
  return payload;
}

std::string GuessContentType(const std::string& path) {
#ifdef WAVECAST_FFMPEG_AVAILABLE
  const AVOutputFormat* format = av_guess_format(nullptr, path.c_str(), nullptr);
  if (format != nullptr && format->mime_type != nullptr && format->mime_type[0] != '\0') {
    return format->mime_type;
  }
#else
  (void)path;
#endif
  return kDefaultContentType;
}

std::string ProbeContainerFormat(const Payload& payload) {
#ifdef WAVECAST_FFMPEG_AVAILABLE
  if (payload.empty()) {
    return "";
  }
  // FFmpeg requires AVPROBE_PADDING_SIZE zeroed bytes past the probe window.
  const size_t n = std::min(payload.size(), kProbeBytes);
  std::vector<uint8_t> window(n + AVPROBE_PADDING_SIZE, 0);
  std::memcpy(window.data(), payload.data(), n);

  AVProbeData probe;
  std::memset(&probe, 0, sizeof(probe));
  probe.filename = payload.source().c_str();
  probe.buf = window.data();
  probe.buf_size = static_cast<int>(n);

  const AVInputFormat* format = av_probe_input_format(&probe, 1);
  if (format != nullptr && format->name != nullptr) {
    return format->name;
  }
#else
  (void)payload;
#endif
  return "";
}

}  // namespace wavecast::payload
