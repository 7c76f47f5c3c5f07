// File: src/core/media/timed_audio_source.cpp
#include "dw/core/media/timed_audio_source.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace dw {

TimedAudioSource::TimedAudioSource(AudioClip clip) : clip_(std::move(clip)) {
  if (clip_.sample_rate <= 0) clip_.sample_rate = 48000;
  samples_per_frame_ = static_cast<std::size_t>(clip_.sample_rate) * kFrameMs / 1000;  // 960 @ 48 kHz
}

void TimedAudioSource::wait_for_slot_() {
  const auto now = Clock::now();
  if (!start_) {
    start_ = now;
    return;
  }

  const double elapsed_s = std::chrono::duration<double>(now - *start_).count();
  const auto target_samples = static_cast<std::int64_t>(elapsed_s * clip_.sample_rate);

  const std::int64_t ahead = position_ - target_samples;
  if (ahead <= 0) return;

  const auto shortfall = std::chrono::ceil<std::chrono::nanoseconds>(
      std::chrono::duration<double>(static_cast<double>(ahead) / clip_.sample_rate));
  std::this_thread::sleep_for(shortfall);
}

AudioFrame TimedAudioSource::next() {
  wait_for_slot_();

  AudioFrame frame;
  frame.pts = position_;
  frame.sample_rate = clip_.sample_rate;
  frame.samples.assign(samples_per_frame_, 0);

  const auto total = static_cast<std::int64_t>(clip_.samples.size());
  if (position_ < total) {
    const std::int64_t n =
        std::min<std::int64_t>(static_cast<std::int64_t>(samples_per_frame_), total - position_);
    std::copy_n(clip_.samples.begin() + position_, n, frame.samples.begin());
  }
  // Past the end: the zero-filled frame is the silence tail.

  position_ += static_cast<std::int64_t>(samples_per_frame_);
  return frame;
}

}  // namespace dw
