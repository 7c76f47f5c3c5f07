// include/dw/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dw {

// -----------------------------
// Basic identifiers
// -----------------------------

using DeviceId = std::string;  // stable registry id, e.g. "123456789"
using EventId = std::string;   // upstream de-duplication id of one motion event
using SessionId = std::string;  // assigned during offer creation, used for teardown

// -----------------------------
// Time
// -----------------------------
// Integer nanoseconds. Steady-clock values are relative to an arbitrary origin and are only
// compared with each other; wall values are epoch ns.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

using DurationNs = std::int64_t;

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

// -----------------------------
// Devices and signals
// -----------------------------

// Read-only view of a registry device.
struct Device {
  DeviceId id;
  std::string name;
  bool supports_two_way_audio = false;
};

// One observed motion. Created by the poller/listener, consumed once by the tracker.
struct MotionSignal {
  DeviceId device_id;
  EventId event_id;
  TimestampNs observed_at;  // wall epoch ns
};

// -----------------------------
// Classification
// -----------------------------

enum class Confidence {
  kLow,
  kMedium,
  kHigh,
};

const char* confidence_name(Confidence c) noexcept;

// Fixed-shape result of one classifier call. Missing keys keep these defaults.
struct ClassificationResult {
  bool is_suspicious = false;
  Confidence confidence = Confidence::kLow;
  bool is_delivery = false;
  std::string description;
  std::string reason;
};

// -----------------------------
// Audio
// -----------------------------

// Decoded mono PCM, ready for TimedAudioSource.
struct AudioClip {
  int sample_rate = 48000;
  std::vector<std::int16_t> samples;

  [[nodiscard]] double duration_s() const noexcept {
    return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
  }
};

}  // namespace dw
