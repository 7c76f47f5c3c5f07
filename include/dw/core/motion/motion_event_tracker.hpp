// File: include/dw/core/motion/motion_event_tracker.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "dw/core/config.hpp"
#include "dw/core/types.hpp"

namespace dw {

enum class GateDecision {
  kAccepted,
  kDuplicate,  // event id already in the device's seen-set
  kCooldown,   // too soon after the last accepted trigger; id is NOT recorded
};

const char* gate_decision_name(GateDecision d) noexcept;

// Per-device dedup + cooldown gate in front of the capture pipeline.
//
// Decision order for one (device, event):
//   1. id already seen            -> kDuplicate
//   2. now - last_triggered < cd  -> kCooldown (nothing recorded)
//   3. otherwise record the id, stamp last_triggered = now -> kAccepted
//
// The seen-set keeps insertion order; once it grows past seen_trim_threshold it is cut back to
// the newest seen_trim_keep ids. All state is in-memory and process-lifetime only.
//
// Thread-safe: one mutex guards the whole map, so the read-then-write of last_triggered and the
// trim are atomic against interleaved signals.
class MotionEventTracker {
 public:
  explicit MotionEventTracker(MotionConfig cfg);

  bool should_trigger(const DeviceId& device_id, const EventId& event_id);

  // Same as should_trigger, with an explicit steady-clock "now".
  GateDecision evaluate_at(const DeviceId& device_id, const EventId& event_id, TimestampNs now);

  [[nodiscard]] std::size_t seen_count(const DeviceId& device_id) const;
  [[nodiscard]] bool has_seen(const DeviceId& device_id, const EventId& event_id) const;
  [[nodiscard]] std::optional<TimestampNs> last_triggered_at(const DeviceId& device_id) const;

 private:
  struct DeviceGateState {
    std::optional<TimestampNs> last_triggered_at;
    std::deque<EventId> seen_order;  // oldest at front
    std::unordered_set<EventId> seen;
  };

  void remember_(DeviceGateState& st, const EventId& event_id);

  MotionConfig cfg_;

  mutable std::mutex mu_;
  std::unordered_map<DeviceId, DeviceGateState> states_;
};

}  // namespace dw
