// File: include/dw/adapters/rtc/opus_frame_encoder.hpp
#pragma once

#include <cstdint>
#include <vector>

#include <opus.h>

#include "dw/core/media/timed_audio_source.hpp"
#include "dw/core/status.hpp"

namespace dw {

// Mono VOIP-profile Opus encoder for 20 ms s16 frames.
class OpusFrameEncoder {
 public:
  OpusFrameEncoder() = default;
  ~OpusFrameEncoder();

  OpusFrameEncoder(const OpusFrameEncoder&) = delete;
  OpusFrameEncoder& operator=(const OpusFrameEncoder&) = delete;

  Status open(int sample_rate, int bitrate_bps = 32000);

  // One Opus packet per frame.
  Result<std::vector<std::uint8_t>> encode(const AudioFrame& frame);

 private:
  OpusEncoder* enc_{nullptr};
  int sample_rate_{0};
};

}  // namespace dw
