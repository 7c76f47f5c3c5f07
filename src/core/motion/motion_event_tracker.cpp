// File: src/core/motion/motion_event_tracker.cpp
#include "dw/core/motion/motion_event_tracker.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "dw/core/util/time.hpp"

namespace dw {

const char* gate_decision_name(GateDecision d) noexcept {
  switch (d) {
    case GateDecision::kAccepted: return "accepted";
    case GateDecision::kDuplicate: return "duplicate";
    case GateDecision::kCooldown: return "cooldown";
  }
  return "unknown";
}

MotionEventTracker::MotionEventTracker(MotionConfig cfg) : cfg_(std::move(cfg)) {}

bool MotionEventTracker::should_trigger(const DeviceId& device_id, const EventId& event_id) {
  return evaluate_at(device_id, event_id, steady_now_ns()) == GateDecision::kAccepted;
}

GateDecision MotionEventTracker::evaluate_at(const DeviceId& device_id, const EventId& event_id,
                                             TimestampNs now) {
  std::lock_guard<std::mutex> lock(mu_);
  DeviceGateState& st = states_[device_id];

  if (st.seen.count(event_id) != 0) {
    return GateDecision::kDuplicate;
  }

  if (st.last_triggered_at) {
    const DurationNs elapsed = now.ns - st.last_triggered_at->ns;
    if (elapsed < cfg_.cooldown_ns) {
      spdlog::debug("MotionEventTracker: {} cooldown active, {:.0f}s remaining", device_id,
                    static_cast<double>(cfg_.cooldown_ns - elapsed) * 1e-9);
      return GateDecision::kCooldown;
    }
  }

  remember_(st, event_id);
  st.last_triggered_at = now;
  return GateDecision::kAccepted;
}

void MotionEventTracker::remember_(DeviceGateState& st, const EventId& event_id) {
  st.seen.insert(event_id);
  st.seen_order.push_back(event_id);

  if (st.seen_order.size() <= cfg_.seen_trim_threshold) return;

  while (st.seen_order.size() > cfg_.seen_trim_keep) {
    st.seen.erase(st.seen_order.front());
    st.seen_order.pop_front();
  }
}

std::size_t MotionEventTracker::seen_count(const DeviceId& device_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = states_.find(device_id);
  return it == states_.end() ? 0 : it->second.seen.size();
}

bool MotionEventTracker::has_seen(const DeviceId& device_id, const EventId& event_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = states_.find(device_id);
  return it != states_.end() && it->second.seen.count(event_id) != 0;
}

std::optional<TimestampNs> MotionEventTracker::last_triggered_at(const DeviceId& device_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = states_.find(device_id);
  if (it == states_.end()) return std::nullopt;
  return it->second.last_triggered_at;
}

}  // namespace dw
