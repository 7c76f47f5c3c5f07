// File: include/dw/adapters/rtc/video_codec.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "dw/adapters/av/av_handles.hpp"
#include "dw/core/media/peer_endpoint.hpp"
#include "dw/core/status.hpp"

namespace dw {

// Decoded picture held by reference; JPEG encoding happens only when asked.
class LibavVideoFrame final : public VideoFrame {
 public:
  explicit LibavVideoFrame(const AVFrame* src);

  Result<std::vector<std::uint8_t>> to_jpeg(int quality) const override;

  int width() const { return frame_ ? frame_->width : 0; }
  int height() const { return frame_ ? frame_->height : 0; }

 private:
  AvFramePtr frame_;
};

// Annex-B H.264 access units in, decoded pictures out. Single-threaded use only.
class H264Decoder {
 public:
  using PictureCallback = std::function<void(const VideoFrame&)>;

  H264Decoder() = default;

  Status open();

  // Feeds one access unit; `on_picture` runs for every picture the decoder releases.
  Status decode(const std::byte* data, std::size_t size, const PictureCallback& on_picture);

 private:
  AvCodecContextPtr ctx_;
  AvPacketPtr pkt_;
  AvFramePtr frame_;
};

}  // namespace dw
