// Repository: wavecast
// Component: IByteSink Interface
// Purpose: Transport-facing byte sink drained by ConsumerSession.
// Copyright (c) 2025 wavecast

#ifndef WAVECAST_OUTPUT_IBYTE_SINK_H_
#define WAVECAST_OUTPUT_IBYTE_SINK_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace wavecast::output {

// IByteSink is one consumer's transport endpoint.
//
// IByteSink responsibilities:
// - Accept byte writes in delivery order
// - Make written bytes observable to the peer on Flush()
// - Report a broken or closed connection by returning false
//
// IByteSink explicitly does NOT:
// - Pace, drop, or reorder bytes
// - Know about the registry or other consumers
class IByteSink {
 public:
  virtual ~IByteSink() = default;

  // Accepts one unit of payload (one slice). May buffer.
  // Returns false once the connection is broken or closed.
  virtual bool Write(const uint8_t* data, size_t len) = 0;

  // Pushes buffered bytes to the peer. Blocks until sent or failed.
  virtual bool Flush() = 0;

  // Makes a blocked Write/Flush fail promptly. Thread-safe; may be called
  // while another thread is inside Flush(). Idempotent.
  virtual void Interrupt() = 0;

  // Ends the stream and releases the transport. Idempotent.
  // Must not race with Write/Flush on another thread.
  virtual void Close() = 0;

  // Human-readable name (peer address) for logging/diagnostics.
  virtual std::string GetName() const = 0;
};

}  // namespace wavecast::output

#endif  // WAVECAST_OUTPUT_IBYTE_SINK_H_
