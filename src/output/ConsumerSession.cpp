// Repository: wavecast
// Component: ConsumerSession
// Purpose: Lifecycle adapter binding one transport sink to one consumer.
// Copyright (c) 2025 wavecast

#include "wavecast/output/ConsumerSession.h"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "wavecast/util/Logger.hpp"

namespace wavecast::output {

using util::Logger;

namespace {

std::string NameOf(const std::unique_ptr<IByteSink>& sink) {
  if (!sink) {
    throw std::invalid_argument("ConsumerSession requires a sink");
  }
  return sink->GetName();
}

}  // namespace

const char* SessionEndReasonToString(SessionEndReason reason) {
  switch (reason) {
    case SessionEndReason::kNotRegistered: return "not_registered";
    case SessionEndReason::kQueueClosed: return "queue_closed";
    case SessionEndReason::kWriteFailed: return "write_failed";
    default: return "unknown";
  }
}

ConsumerSession::ConsumerSession(broadcast::ConsumerRegistry& registry,
                                 std::unique_ptr<IByteSink> sink,
                                 size_t queue_capacity)
    : registry_(registry),
      consumer_(NameOf(sink), queue_capacity) {
  sink_ = std::move(sink);
}

ConsumerSession::~ConsumerSession() {
  // Must leave the registry before consumer_ is destroyed.
  Deregister();
  sink_->Close();
}

bool ConsumerSession::Open() {
  bool expected = false;
  if (!opened_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }
  if (!registry_.Add(&consumer_)) {
    return false;
  }
  registered_.store(true, std::memory_order_release);
  return true;
}

SessionEndReason ConsumerSession::Run() {
  if (!IsRegistered()) {
    return SessionEndReason::kNotRegistered;
  }

  SessionEndReason reason = SessionEndReason::kQueueClosed;
  while (true) {
    std::optional<broadcast::SliceBytes> slice = consumer_.Queue().Receive();
    if (!slice) {
      reason = SessionEndReason::kQueueClosed;
      break;
    }
    if (!sink_->Write(slice->data(), slice->size()) || !sink_->Flush()) {
      // An interrupted sink fails too; that is the owner's Close(), not a fault.
      reason = closed_by_owner_.load(std::memory_order_acquire)
                   ? SessionEndReason::kQueueClosed
                   : SessionEndReason::kWriteFailed;
      break;
    }
    slices_written_.fetch_add(1, std::memory_order_relaxed);
    bytes_written_.fetch_add(slice->size(), std::memory_order_relaxed);
  }

  Deregister();

  std::ostringstream oss;
  oss << "[ConsumerSession] " << consumer_.Name() << " stream ended: "
      << SessionEndReasonToString(reason)
      << " slices=" << slices_written_.load(std::memory_order_relaxed)
      << " bytes=" << bytes_written_.load(std::memory_order_relaxed)
      << " dropped=" << consumer_.Queue().DroppedCount();
  Logger::Info(oss.str());
  return reason;
}

void ConsumerSession::Close() {
  closed_by_owner_.store(true, std::memory_order_release);
  Deregister();
  sink_->Interrupt();
}

void ConsumerSession::Deregister() {
  if (!registered_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  // Returns false when CloseAll() already released this consumer; either
  // way the queue is closed and no further Broadcast can reach it.
  registry_.Remove(&consumer_);
}

}  // namespace wavecast::output
