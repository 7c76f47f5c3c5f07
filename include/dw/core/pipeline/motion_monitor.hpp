// File: include/dw/core/pipeline/motion_monitor.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "dw/core/config.hpp"
#include "dw/core/events/run_journal.hpp"
#include "dw/core/media/device_endpoint.hpp"
#include "dw/core/pipeline/detection_pipeline.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"
#include "dw/core/util/worker_pool.hpp"

namespace dw {

struct ScanStats {
  std::size_t devices = 0;
  std::size_t signals = 0;     // motion events seen in history this scan
  std::size_t dispatched = 0;  // passed the gate and handed to a worker
  std::size_t device_errors = 0;
};

// Signal ingestion and scheduling.
//
// Poll mode: every scan_interval, refresh the registry, read each doorbell's recent motion
// history and dispatch every event. Push mode: the registry is still refreshed on the same
// cadence, but signals arrive through dispatch() from an external listener.
//
// dispatch() gates on the calling thread and hands accepted signals to the worker pool; the
// calling thread never waits on capture or classification.
class MotionMonitor {
 public:
  using StopPredicate = std::function<bool()>;

  MotionMonitor(DeviceRegistry& registry, DetectionPipeline& pipeline, WorkerPool& pool,
                MonitorConfig cfg, int history_limit, RunJournal* journal = nullptr);

  // Reloads devices and caches them by id for dispatch().
  Status refresh_devices();

  // One poll cycle. Per-device failures are logged and counted; they never abort the scan.
  ScanStats scan_once();

  // Thread-safe. Returns true if the signal was handed to a worker.
  bool dispatch(const MotionSignal& signal);

  // Blocks until request_stop(), `stop_requested` returns true, or max_run_s elapses.
  void run(const StopPredicate& stop_requested = {});

  void request_stop() noexcept { stop_.store(true); }

  [[nodiscard]] std::vector<Device> known_devices() const;

 private:
  bool sleep_interruptible_(DurationNs d, const StopPredicate& stop_requested);
  bool should_stop_(const StopPredicate& stop_requested) const;

  DeviceRegistry& registry_;
  DetectionPipeline& pipeline_;
  WorkerPool& pool_;
  MonitorConfig cfg_;
  int history_limit_;
  RunJournal* journal_;

  mutable std::mutex devices_mu_;
  std::unordered_map<DeviceId, Device> devices_;

  std::atomic<bool> stop_{false};
};

}  // namespace dw
