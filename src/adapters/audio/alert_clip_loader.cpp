// File: src/adapters/audio/alert_clip_loader.cpp
#include "dw/adapters/audio/alert_clip_loader.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include <spdlog/spdlog.h>

#include "dw/adapters/av/av_handles.hpp"

namespace dw {
namespace {

struct FormatCloser {
  void operator()(AVFormatContext* f) const noexcept { avformat_close_input(&f); }
};
using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;

struct SwrDeleter {
  void operator()(SwrContext* s) const noexcept { swr_free(&s); }
};
using SwrPtr = std::unique_ptr<SwrContext, SwrDeleter>;

class ClipBuilder {
 public:
  ClipBuilder(SwrContext* swr, int out_rate, std::size_t max_samples)
      : swr_(swr), out_rate_(out_rate), max_samples_(max_samples) {}

  // `frame == nullptr` drains the resampler.
  Status push(const AVFrame* frame) {
    if (full()) return Status::ok_status();

    const int in_samples = frame ? frame->nb_samples : 0;
    const int capacity = swr_get_out_samples(swr_, in_samples);
    if (capacity <= 0) return Status::ok_status();

    std::vector<std::int16_t> buf(static_cast<std::size_t>(capacity));
    auto* out_planes = reinterpret_cast<std::uint8_t*>(buf.data());
    const int converted =
        swr_convert(swr_, &out_planes, capacity,
                    frame ? const_cast<const std::uint8_t**>(frame->extended_data) : nullptr, in_samples);
    if (converted < 0) return Status::corrupt_data(av_error_text("swr_convert", converted));

    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(converted),
                                                   max_samples_ - clip_.samples.size());
    clip_.samples.insert(clip_.samples.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(take));
    return Status::ok_status();
  }

  bool full() const { return clip_.samples.size() >= max_samples_; }

  AudioClip take() {
    clip_.sample_rate = out_rate_;
    return std::move(clip_);
  }

 private:
  SwrContext* swr_;
  int out_rate_;
  std::size_t max_samples_;
  AudioClip clip_;
};

}  // namespace

Result<AudioClip> load_alert_clip(const std::string& path, double max_duration_s, int sample_rate) {
  using R = Result<AudioClip>;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return R::err(Status::not_found("alert sound file not found: " + path));
  }

  AVFormatContext* raw_fmt = nullptr;
  int rc = avformat_open_input(&raw_fmt, path.c_str(), nullptr, nullptr);
  if (rc < 0) return R::err(Status::corrupt_data(av_error_text("avformat_open_input", rc)));
  FormatPtr fmt(raw_fmt);

  rc = avformat_find_stream_info(fmt.get(), nullptr);
  if (rc < 0) return R::err(Status::corrupt_data(av_error_text("avformat_find_stream_info", rc)));

  const AVCodec* codec = nullptr;
  const int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || !codec) return R::err(Status::corrupt_data("no audio stream in " + path));

  AvCodecContextPtr dec(avcodec_alloc_context3(codec));
  if (!dec) return R::err(Status::internal("avcodec_alloc_context3 failed"));
  rc = avcodec_parameters_to_context(dec.get(), fmt->streams[stream_index]->codecpar);
  if (rc < 0) return R::err(Status::internal(av_error_text("avcodec_parameters_to_context", rc)));
  rc = avcodec_open2(dec.get(), codec, nullptr);
  if (rc < 0) return R::err(Status::corrupt_data(av_error_text("avcodec_open2", rc)));

  AVChannelLayout out_layout;
  av_channel_layout_default(&out_layout, 1);
  AVChannelLayout in_layout = dec->ch_layout;
  if (in_layout.nb_channels == 0) av_channel_layout_default(&in_layout, 1);

  SwrContext* raw_swr = nullptr;
  rc = swr_alloc_set_opts2(&raw_swr, &out_layout, AV_SAMPLE_FMT_S16, sample_rate, &in_layout,
                           dec->sample_fmt, dec->sample_rate, 0, nullptr);
  SwrPtr swr(raw_swr);
  if (rc < 0 || !swr) return R::err(Status::internal(av_error_text("swr_alloc_set_opts2", rc)));
  rc = swr_init(swr.get());
  if (rc < 0) return R::err(Status::internal(av_error_text("swr_init", rc)));

  const auto max_samples = static_cast<std::size_t>(std::max(0.0, max_duration_s) * sample_rate);
  ClipBuilder builder(swr.get(), sample_rate, max_samples);

  AvPacketPtr pkt(av_packet_alloc());
  AvFramePtr frame(av_frame_alloc());
  if (!pkt || !frame) return R::err(Status::internal("libav allocation failed"));

  auto drain_decoder = [&]() -> Status {
    while (true) {
      const int r = avcodec_receive_frame(dec.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return Status::ok_status();
      if (r < 0) return Status::corrupt_data(av_error_text("avcodec_receive_frame", r));
      const Status st = builder.push(frame.get());
      av_frame_unref(frame.get());
      DW_RETURN_IF_ERROR(st);
    }
  };

  while (!builder.full() && av_read_frame(fmt.get(), pkt.get()) >= 0) {
    if (pkt->stream_index == stream_index) {
      rc = avcodec_send_packet(dec.get(), pkt.get());
      av_packet_unref(pkt.get());
      if (rc < 0 && rc != AVERROR(EAGAIN)) {
        return R::err(Status::corrupt_data(av_error_text("avcodec_send_packet", rc)));
      }
      const Status st = drain_decoder();
      if (!st.ok()) return R::err(st);
    } else {
      av_packet_unref(pkt.get());
    }
  }

  if (!builder.full()) {
    (void)avcodec_send_packet(dec.get(), nullptr);
    const Status st = drain_decoder();
    if (!st.ok()) return R::err(st);
    const Status flushed = builder.push(nullptr);
    if (!flushed.ok()) return R::err(flushed);
  }

  AudioClip clip = builder.take();
  if (clip.samples.empty()) return R::err(Status::corrupt_data("alert clip decoded to no samples: " + path));

  spdlog::info("AlertClip: loaded {} ({:.2f}s at {} Hz)", path, clip.duration_s(), clip.sample_rate);
  return R::ok(std::move(clip));
}

}  // namespace dw
