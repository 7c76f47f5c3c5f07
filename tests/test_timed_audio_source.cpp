// File: tests/test_timed_audio_source.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>

#include "dw/core/media/timed_audio_source.hpp"

namespace dw {
namespace {

AudioClip ramp_clip(std::size_t n) {
  AudioClip clip;
  clip.sample_rate = 48000;
  clip.samples.resize(n);
  for (std::size_t i = 0; i < n; ++i) clip.samples[i] = static_cast<std::int16_t>(i % 1000 + 1);
  return clip;
}

TEST(TimedAudioSource, FramesAreTwentyMillisecondsWithRunningPts) {
  TimedAudioSource src(ramp_clip(48000));
  EXPECT_EQ(src.samples_per_frame(), 960u);

  const AudioFrame a = src.next();
  const AudioFrame b = src.next();
  EXPECT_EQ(a.pts, 0);
  EXPECT_EQ(b.pts, 960);
  EXPECT_EQ(a.samples.size(), 960u);
  EXPECT_EQ(a.sample_rate, 48000);
  EXPECT_EQ(a.samples[0], 1);
  EXPECT_EQ(b.samples[0], static_cast<std::int16_t>(960 % 1000 + 1));
}

TEST(TimedAudioSource, ShortFinalFrameIsZeroPadded) {
  TimedAudioSource src(ramp_clip(1000));
  (void)src.next();
  const AudioFrame tail = src.next();
  EXPECT_NE(tail.samples[39], 0);  // sample 999
  EXPECT_EQ(tail.samples[40], 0);
  EXPECT_TRUE(src.exhausted());
}

TEST(TimedAudioSource, SilenceAfterClipEnds) {
  TimedAudioSource src(ramp_clip(960));
  (void)src.next();
  ASSERT_TRUE(src.exhausted());
  for (int i = 0; i < 3; ++i) {
    const AudioFrame f = src.next();
    EXPECT_EQ(f.samples.size(), 960u);
    for (auto s : f.samples) ASSERT_EQ(s, 0);
  }
}

TEST(TimedAudioSource, PacesToRealTime) {
  TimedAudioSource src(ramp_clip(48000));
  const auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < 11; ++i) (void)src.next();  // 10 paced intervals
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  // 10 frames * 20 ms; generous upper bound for loaded CI machines.
  EXPECT_GE(elapsed, std::chrono::milliseconds(195));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(TimedAudioSource, NonPositiveRateFallsBackToOpusClock) {
  AudioClip clip;
  clip.sample_rate = 0;
  clip.samples.assign(10, 5);
  TimedAudioSource src(clip);
  EXPECT_EQ(src.sample_rate(), 48000);
  EXPECT_EQ(src.samples_per_frame(), 960u);
}

}  // namespace
}  // namespace dw
