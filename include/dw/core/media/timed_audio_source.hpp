// File: include/dw/core/media/timed_audio_source.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "dw/core/types.hpp"

namespace dw {

struct AudioFrame {
  std::int64_t pts = 0;  // first sample index of this frame
  int sample_rate = 48000;
  std::vector<std::int16_t> samples;  // mono s16, exactly samples_per_frame()
};

// Real-time paced 20 ms mono frames over a decoded clip.
//
// Pacing: before releasing the frame that starts at sample `position`, the source waits until
// at least position / sample_rate seconds have passed since the first next() call. Once the
// clip is exhausted it keeps returning zero-filled frames, so the session feeding off it stays
// alive for whatever duration the caller holds it open.
//
// Single consumer; construct a new instance to restart.
class TimedAudioSource {
 public:
  static constexpr int kFrameMs = 20;

  explicit TimedAudioSource(AudioClip clip);

  // Blocks for the pacing shortfall, then returns the next frame.
  AudioFrame next();

  [[nodiscard]] int sample_rate() const noexcept { return clip_.sample_rate; }
  [[nodiscard]] std::size_t samples_per_frame() const noexcept { return samples_per_frame_; }
  [[nodiscard]] std::int64_t position() const noexcept { return position_; }
  [[nodiscard]] bool exhausted() const noexcept {
    return position_ >= static_cast<std::int64_t>(clip_.samples.size());
  }

 private:
  using Clock = std::chrono::steady_clock;

  void wait_for_slot_();

  AudioClip clip_;
  std::size_t samples_per_frame_;
  std::int64_t position_{0};
  std::optional<Clock::time_point> start_;
};

}  // namespace dw
