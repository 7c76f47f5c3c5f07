// File: include/dw/core/events/run_journal.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

#include "dw/core/events/event_sink.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// RunJournal owns the journal lifecycle for one process run.
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
//
// emit() is safe to call from pipeline workers once start() has returned; a journal that was
// never started (or was stopped) drops events silently.
class RunJournal {
 public:
  RunJournal(EventSink& sink, std::string out_dir, std::size_t keep_runs);

  Status start(RunInfo run);

  Status emit(const std::string& type, const std::string& message);
  Status emit(const std::string& type, const DeviceId& device_id, const EventId& event_id,
              const std::string& message);

  void stop();

  [[nodiscard]] bool started() const noexcept { return started_.load(); }

  // Deletes all but the newest `keep_last` events_<epoch>.jsonl files in out_dir.
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

 private:
  TimestampNs since_start_ns() const;

  EventSink& sink_;
  std::string out_dir_;
  std::size_t keep_runs_;

  std::chrono::steady_clock::time_point t0_steady_{};
  std::atomic<bool> started_{false};
};

}  // namespace dw
