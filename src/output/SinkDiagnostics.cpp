// Repository: wavecast
// Component: Sink diagnostics for broken-pipe debugging
// Purpose: First-write-failure latch per sink, and logged fd close (CLOSE_FD).
// Copyright (c) 2025 wavecast

#include "wavecast/output/SinkDiagnostics.h"

#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>

#include <unistd.h>

#include "wavecast/util/Logger.hpp"

namespace wavecast::output {

using util::Logger;

namespace {

// One-time log latch per sink_ptr so we only print once per sink.
std::mutex g_first_failure_mutex;
std::unordered_set<const void*> g_first_failure_logged;

const char* OutputKindToString(OutputKind k) {
  switch (k) {
    case OutputKind::kSocket: return "socket";
    default: return "unknown";
  }
}

}  // namespace

bool LogFirstWriteFailure(OutputKind output_kind,
                          int fd,
                          const void* sink_ptr,
                          const std::string& sink_name,
                          const std::string& detail) {
  if (!sink_ptr) return false;
  {
    std::lock_guard<std::mutex> lock(g_first_failure_mutex);
    if (!g_first_failure_logged.insert(sink_ptr).second) {
      return false;
    }
  }

  std::ostringstream oss;
  oss << "[EPIPE-FIRST] output_kind=" << OutputKindToString(output_kind)
      << " fd=" << fd
      << " sink=" << sink_name
      << " detail=" << (detail.empty() ? "n/a" : detail)
      << " thread_id=" << std::this_thread::get_id();
  Logger::Warn(oss.str());
  return true;
}

void ForgetWriteFailure(const void* sink_ptr) {
  std::lock_guard<std::mutex> lock(g_first_failure_mutex);
  g_first_failure_logged.erase(sink_ptr);
}

void CloseFdWithLog(int fd, const char* reason, const char* file, int line) {
  if (fd < 0) return;
  std::ostringstream oss;
  oss << "[CLOSE_FD] file=" << file << " line=" << line
      << " thread_id=" << std::this_thread::get_id()
      << " fd=" << fd
      << " reason=" << (reason ? reason : "");
  Logger::Debug(oss.str());
  ::close(fd);
}

}  // namespace wavecast::output
