// Repository: wavecast
// Component: Sink diagnostics for broken-pipe debugging
// Purpose: First-write-failure latch per sink, and logged fd close (CLOSE_FD).
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_OUTPUT_SINK_DIAGNOSTICS_H_
#define WAVECAST_OUTPUT_SINK_DIAGNOSTICS_H_

#include <cstdint>
#include <string>

namespace wavecast::output {

// Output kind (identifies the target of the broken pipe).
enum class OutputKind {
  kSocket,
};

// Logs once per sink_ptr when its first write fails. Later failures of the
// same sink are silent. Returns true if this call did the log.
bool LogFirstWriteFailure(OutputKind output_kind,
                          int fd,
                          const void* sink_ptr,
                          const std::string& sink_name,
                          const std::string& detail);

// Clears the latch for sink_ptr. Sinks call this on destruction so a later
// sink allocated at the same address logs its own first failure.
void ForgetWriteFailure(const void* sink_ptr);

// Closes fd with a diagnostic log line (file:line, thread, reason).
// Use macro CLOSE_FD(fd, reason).
void CloseFdWithLog(int fd, const char* reason, const char* file, int line);

}  // namespace wavecast::output

// Instrument all closes of output fds.
#define CLOSE_FD(fd, reason) \
  ::wavecast::output::CloseFdWithLog((fd), (reason), __FILE__, __LINE__)

#endif  // WAVECAST_OUTPUT_SINK_DIAGNOSTICS_H_
