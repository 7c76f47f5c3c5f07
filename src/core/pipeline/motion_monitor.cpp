// File: src/core/pipeline/motion_monitor.cpp
#include "dw/core/pipeline/motion_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace dw {
namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kStopPollSlice = std::chrono::milliseconds(200);

}  // namespace

MotionMonitor::MotionMonitor(DeviceRegistry& registry, DetectionPipeline& pipeline, WorkerPool& pool,
                             MonitorConfig cfg, int history_limit, RunJournal* journal)
    : registry_(registry),
      pipeline_(pipeline),
      pool_(pool),
      cfg_(std::move(cfg)),
      history_limit_(history_limit),
      journal_(journal) {}

Status MotionMonitor::refresh_devices() {
  DW_RETURN_IF_ERROR(registry_.refresh());

  std::unordered_map<DeviceId, Device> fresh;
  for (const Device& d : registry_.doorbells()) fresh.emplace(d.id, d);

  std::lock_guard<std::mutex> lock(devices_mu_);
  devices_ = std::move(fresh);
  return Status::ok_status();
}

std::vector<Device> MotionMonitor::known_devices() const {
  std::lock_guard<std::mutex> lock(devices_mu_);
  std::vector<Device> out;
  out.reserve(devices_.size());
  for (const auto& kv : devices_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), [](const Device& a, const Device& b) { return a.name < b.name; });
  return out;
}

bool MotionMonitor::dispatch(const MotionSignal& signal) {
  Device device;
  {
    std::lock_guard<std::mutex> lock(devices_mu_);
    auto it = devices_.find(signal.device_id);
    if (it == devices_.end()) {
      spdlog::warn("MotionMonitor: motion for unknown device {} ignored", signal.device_id);
      return false;
    }
    device = it->second;
  }

  if (!pipeline_.gate(signal)) return false;

  std::shared_ptr<DeviceEndpoint> remote = registry_.endpoint(device);
  if (!remote) {
    spdlog::error("MotionMonitor: no media endpoint for {}", device.name);
    return false;
  }

  const bool queued = pool_.try_submit([this, signal, device, remote]() {
    pipeline_.process(signal, device, *remote);
  });
  if (!queued) {
    spdlog::warn("MotionMonitor: pipeline saturated, dropping event {} on {}", signal.event_id,
                 device.name);
    if (journal_) {
      const Status st = journal_->emit("motion_rejected", signal.device_id, signal.event_id, "saturated");
      if (!st.ok()) spdlog::debug("MotionMonitor: journal write failed: {}", st.message());
    }
    return false;
  }
  return true;
}

ScanStats MotionMonitor::scan_once() {
  ScanStats stats;

  const Status refreshed = refresh_devices();
  if (!refreshed.ok()) {
    // Keep scanning with the last known device list.
    spdlog::error("MotionMonitor: device refresh failed: {}", refreshed.message());
  }

  for (const Device& device : known_devices()) {
    ++stats.devices;
    try {
      auto history = registry_.recent_motion(device, history_limit_);
      if (!history.ok()) {
        ++stats.device_errors;
        spdlog::error("MotionMonitor: error checking {}: {}", device.name, history.status().message());
        continue;
      }
      for (const MotionSignal& s : history.value()) {
        ++stats.signals;
        if (dispatch(s)) ++stats.dispatched;
      }
    } catch (const std::exception& e) {
      ++stats.device_errors;
      spdlog::error("MotionMonitor: error checking {}: {}", device.name, e.what());
    }
  }

  spdlog::debug("MotionMonitor: scan done: devices={} signals={} dispatched={} errors={}",
                stats.devices, stats.signals, stats.dispatched, stats.device_errors);
  return stats;
}

bool MotionMonitor::should_stop_(const StopPredicate& stop_requested) const {
  if (stop_.load()) return true;
  return stop_requested && stop_requested();
}

bool MotionMonitor::sleep_interruptible_(DurationNs d, const StopPredicate& stop_requested) {
  const auto until = Clock::now() + std::chrono::nanoseconds(d);
  while (Clock::now() < until) {
    if (should_stop_(stop_requested)) return false;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
    std::this_thread::sleep_for(std::max(std::chrono::milliseconds(0), std::min(kStopPollSlice, left)));
  }
  return !should_stop_(stop_requested);
}

void MotionMonitor::run(const StopPredicate& stop_requested) {
  const bool poll = cfg_.mode == MonitorMode::kPoll;
  const bool bounded = cfg_.max_run_s > 0.0;
  const auto run_until =
      Clock::now() + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.max_run_s));

  if (poll) {
    spdlog::info("MotionMonitor: polling every {:.0f}s", static_cast<double>(cfg_.scan_interval_ns) / 1e9);
  } else {
    spdlog::info("MotionMonitor: waiting for pushed motion events");
  }

  while (!should_stop_(stop_requested)) {
    if (bounded && Clock::now() >= run_until) {
      spdlog::info("MotionMonitor: max_run_s reached");
      if (journal_) (void)journal_->emit("shutdown", "max_run_s reached");
      return;
    }

    if (poll) {
      (void)scan_once();
    } else {
      const Status st = refresh_devices();
      if (!st.ok()) spdlog::error("MotionMonitor: device refresh failed: {}", st.message());
    }

    DurationNs pause = cfg_.scan_interval_ns;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(run_until - Clock::now());
      pause = std::max<DurationNs>(0, std::min<DurationNs>(pause, left.count()));
    }
    if (!sleep_interruptible_(pause, stop_requested)) break;
  }

  spdlog::info("MotionMonitor: stop requested");
  if (journal_) (void)journal_->emit("shutdown", "stop requested");
}

}  // namespace dw
