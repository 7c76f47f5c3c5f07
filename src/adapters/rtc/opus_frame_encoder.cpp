// File: src/adapters/rtc/opus_frame_encoder.cpp
#include "dw/adapters/rtc/opus_frame_encoder.hpp"

#include <string>

namespace dw {
namespace {

constexpr int kMaxPacketBytes = 1500;

}  // namespace

OpusFrameEncoder::~OpusFrameEncoder() {
  if (enc_) opus_encoder_destroy(enc_);
}

Status OpusFrameEncoder::open(int sample_rate, int bitrate_bps) {
  int err = OPUS_OK;
  enc_ = opus_encoder_create(sample_rate, 1, OPUS_APPLICATION_VOIP, &err);
  if (err != OPUS_OK || !enc_) {
    enc_ = nullptr;
    return Status::internal(std::string("opus_encoder_create: ") + opus_strerror(err));
  }
  opus_encoder_ctl(enc_, OPUS_SET_BITRATE(bitrate_bps));
  sample_rate_ = sample_rate;
  return Status::ok_status();
}

Result<std::vector<std::uint8_t>> OpusFrameEncoder::encode(const AudioFrame& frame) {
  using R = Result<std::vector<std::uint8_t>>;
  if (!enc_) return R::err(Status::internal("OpusFrameEncoder used before open()"));
  if (frame.sample_rate != sample_rate_) {
    return R::err(Status::invalid_argument("opus: frame rate " + std::to_string(frame.sample_rate) +
                                           " != encoder rate " + std::to_string(sample_rate_)));
  }

  std::vector<std::uint8_t> out(kMaxPacketBytes);
  const opus_int32 n = opus_encode(enc_, frame.samples.data(), static_cast<int>(frame.samples.size()),
                                   out.data(), static_cast<opus_int32>(out.size()));
  if (n < 0) return R::err(Status::internal(std::string("opus_encode: ") + opus_strerror(n)));
  out.resize(static_cast<std::size_t>(n));
  return R::ok(std::move(out));
}

}  // namespace dw
