// File: include/dw/core/events/event_sink.hpp
#pragma once

#include <string>

#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Run journal model.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;
  std::string out_dir;
  std::string mode;  // "poll" | "push"
  std::size_t device_count = 0;

  TimestampNs start_time_ns;       // relative run time, always 0
  TimestampNs wall_start_time_ns;  // epoch ns
};

struct Event {
  std::string type;  // e.g. "motion_accepted", "capture_failed", "classified"
  TimestampNs t_ns;
  TimestampNs t_wall_ns;

  // Empty for run-level events.
  DeviceId device_id;
  EventId event_id;

  std::string message;  // optional human-readable hint
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace dw
