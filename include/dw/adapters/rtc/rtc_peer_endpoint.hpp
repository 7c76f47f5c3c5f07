// File: include/dw/adapters/rtc/rtc_peer_endpoint.hpp
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <rtc/rtc.hpp>

#include "dw/core/config.hpp"
#include "dw/core/media/peer_endpoint.hpp"

namespace dw {

// PeerEndpoint over libdatachannel.
//
// Inbound video: H.264 RTP -> H264RtpDepacketizer -> libavcodec -> VideoFrame callback.
// Outbound audio: TimedAudioSource -> Opus -> OpusRtpPacketizer (+ SR reporter), fed by a
// dedicated thread once the track opens.
//
// Transport callbacks only touch a shared state block, so they stay harmless if they fire
// while (or after) close() runs.
class RtcPeerEndpoint final : public PeerEndpoint {
 public:
  explicit RtcPeerEndpoint(const CaptureConfig& cfg);
  ~RtcPeerEndpoint() override;

  Status add_recv_video(VideoFrameCallback on_frame) override;
  Status add_recv_audio() override;
  Status add_send_audio(std::unique_ptr<TimedAudioSource> source) override;

  Result<SessionId> create_offer() override;
  bool gathering_complete() const override;
  Result<std::string> local_sdp() const override;
  Status apply_answer(const std::string& answer_sdp) override;

  bool connected() const override;
  bool failed() const override;
  bool audio_failed() const override;

  void close() override;

 private:
  struct Shared;

  void audio_loop_(std::unique_ptr<TimedAudioSource> source);

  std::shared_ptr<Shared> shared_;
  std::shared_ptr<rtc::PeerConnection> pc_;
  std::shared_ptr<rtc::Track> video_track_;
  std::shared_ptr<rtc::Track> audio_recv_track_;
  std::shared_ptr<rtc::Track> audio_send_track_;
  std::thread audio_thread_;
  bool closed_{false};
};

class RtcPeerEndpointFactory final : public PeerEndpointFactory {
 public:
  explicit RtcPeerEndpointFactory(CaptureConfig cfg);

  std::unique_ptr<PeerEndpoint> create() override;

 private:
  CaptureConfig cfg_;
};

// Routes libdatachannel's own log lines into spdlog. Call once at startup.
void init_rtc_logging();

}  // namespace dw
