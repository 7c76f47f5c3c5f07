// File: src/adapters/rtc/video_codec.cpp
#include "dw/adapters/rtc/video_codec.hpp"

#include <algorithm>
#include <cstring>
#include <string>

extern "C" {
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace dw {
namespace {

struct SwsDeleter {
  void operator()(SwsContext* s) const noexcept { sws_freeContext(s); }
};
using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;

// 1..100 (libjpeg style, higher is better) -> mjpeg qscale 31..2.
int quality_to_qscale(int quality) {
  quality = std::clamp(quality, 1, 100);
  return 2 + ((100 - quality) * 29) / 99;
}

}  // namespace

// -----------------------------
// LibavVideoFrame
// -----------------------------

LibavVideoFrame::LibavVideoFrame(const AVFrame* src) : frame_(av_frame_alloc()) {
  if (frame_ && av_frame_ref(frame_.get(), src) < 0) frame_.reset();
}

Result<std::vector<std::uint8_t>> LibavVideoFrame::to_jpeg(int quality) const {
  using R = Result<std::vector<std::uint8_t>>;
  if (!frame_ || frame_->width <= 0 || frame_->height <= 0) {
    return R::err(Status::corrupt_data("empty video frame"));
  }

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec) return R::err(Status::unsupported("libavcodec has no MJPEG encoder"));

  AvCodecContextPtr enc(avcodec_alloc_context3(codec));
  if (!enc) return R::err(Status::internal("avcodec_alloc_context3 failed"));

  const int w = frame_->width;
  const int h = frame_->height;
  enc->width = w;
  enc->height = h;
  enc->pix_fmt = AV_PIX_FMT_YUVJ420P;
  enc->time_base = AVRational{1, 25};
  enc->flags |= AV_CODEC_FLAG_QSCALE;
  enc->global_quality = FF_QP2LAMBDA * quality_to_qscale(quality);

  int rc = avcodec_open2(enc.get(), codec, nullptr);
  if (rc < 0) return R::err(Status::internal(av_error_text("avcodec_open2(mjpeg)", rc)));

  // Decoder output is usually yuv420p; the MJPEG encoder wants full-range yuvj420p.
  AvFramePtr yuv(av_frame_alloc());
  if (!yuv) return R::err(Status::internal("av_frame_alloc failed"));
  yuv->format = enc->pix_fmt;
  yuv->width = w;
  yuv->height = h;
  rc = av_frame_get_buffer(yuv.get(), 0);
  if (rc < 0) return R::err(Status::internal(av_error_text("av_frame_get_buffer", rc)));

  SwsPtr sws(sws_getContext(w, h, static_cast<AVPixelFormat>(frame_->format), w, h, enc->pix_fmt,
                            SWS_BILINEAR, nullptr, nullptr, nullptr));
  if (!sws) return R::err(Status::internal("sws_getContext failed"));
  sws_scale(sws.get(), frame_->data, frame_->linesize, 0, h, yuv->data, yuv->linesize);
  yuv->quality = enc->global_quality;
  yuv->pts = 0;

  rc = avcodec_send_frame(enc.get(), yuv.get());
  if (rc < 0) return R::err(Status::internal(av_error_text("avcodec_send_frame(mjpeg)", rc)));
  rc = avcodec_send_frame(enc.get(), nullptr);
  if (rc < 0) return R::err(Status::internal(av_error_text("avcodec_send_frame(flush)", rc)));

  AvPacketPtr pkt(av_packet_alloc());
  if (!pkt) return R::err(Status::internal("av_packet_alloc failed"));
  rc = avcodec_receive_packet(enc.get(), pkt.get());
  if (rc < 0) return R::err(Status::internal(av_error_text("avcodec_receive_packet(mjpeg)", rc)));

  std::vector<std::uint8_t> out(pkt->data, pkt->data + pkt->size);
  return R::ok(std::move(out));
}

// -----------------------------
// H264Decoder
// -----------------------------

Status H264Decoder::open() {
  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
  if (!codec) return Status::unsupported("libavcodec has no H.264 decoder");

  ctx_.reset(avcodec_alloc_context3(codec));
  pkt_.reset(av_packet_alloc());
  frame_.reset(av_frame_alloc());
  if (!ctx_ || !pkt_ || !frame_) return Status::internal("libavcodec allocation failed");

  const int rc = avcodec_open2(ctx_.get(), codec, nullptr);
  if (rc < 0) return Status::internal(av_error_text("avcodec_open2(h264)", rc));
  return Status::ok_status();
}

Status H264Decoder::decode(const std::byte* data, std::size_t size, const PictureCallback& on_picture) {
  if (!ctx_) return Status::internal("H264Decoder used before open()");
  if (size == 0) return Status::ok_status();

  // The packet owns a padded copy; the decoder may read past the payload end.
  int rc = av_new_packet(pkt_.get(), static_cast<int>(size));
  if (rc < 0) return Status::internal(av_error_text("av_new_packet", rc));
  std::memcpy(pkt_->data, data, size);

  rc = avcodec_send_packet(ctx_.get(), pkt_.get());
  av_packet_unref(pkt_.get());
  if (rc < 0 && rc != AVERROR(EAGAIN)) {
    // Broken access units are common before the first keyframe.
    return Status::corrupt_data(av_error_text("avcodec_send_packet(h264)", rc));
  }

  while (true) {
    rc = avcodec_receive_frame(ctx_.get(), frame_.get());
    if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) break;
    if (rc < 0) return Status::corrupt_data(av_error_text("avcodec_receive_frame(h264)", rc));
    if (on_picture) on_picture(LibavVideoFrame(frame_.get()));
    av_frame_unref(frame_.get());
  }
  return Status::ok_status();
}

}  // namespace dw
