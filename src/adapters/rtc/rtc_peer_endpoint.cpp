// File: src/adapters/rtc/rtc_peer_endpoint.cpp
#include "dw/adapters/rtc/rtc_peer_endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>

#include "dw/adapters/rtc/opus_frame_encoder.hpp"
#include "dw/adapters/rtc/video_codec.hpp"
#include "dw/core/media/sdp.hpp"

namespace dw {
namespace {

constexpr int kH264PayloadType = 96;
constexpr int kOpusPayloadType = 111;
constexpr rtc::SSRC kAudioSsrc = 4242;

constexpr auto kTrackOpenPoll = std::chrono::milliseconds(20);

}  // namespace

struct RtcPeerEndpoint::Shared {
  std::atomic<bool> gathered{false};
  std::atomic<bool> connected{false};
  std::atomic<bool> failed{false};
  std::atomic<bool> audio_failed{false};
  std::atomic<bool> closing{false};

  std::mutex video_mu;
  VideoFrameCallback on_frame;
  H264Decoder decoder;
  bool decoder_open{false};
};

RtcPeerEndpoint::RtcPeerEndpoint(const CaptureConfig& cfg) : shared_(std::make_shared<Shared>()) {
  rtc::Configuration config;
  if (!cfg.stun_server.empty()) config.iceServers.emplace_back(cfg.stun_server);
  config.disableAutoNegotiation = true;

  pc_ = std::make_shared<rtc::PeerConnection>(config);

  std::weak_ptr<Shared> weak = shared_;
  pc_->onStateChange([weak](rtc::PeerConnection::State state) {
    auto s = weak.lock();
    if (!s) return;
    switch (state) {
      case rtc::PeerConnection::State::Connected:
        s->connected.store(true);
        break;
      case rtc::PeerConnection::State::Failed:
      case rtc::PeerConnection::State::Closed:
        s->failed.store(true);
        break;
      default:
        break;
    }
  });
  pc_->onGatheringStateChange([weak](rtc::PeerConnection::GatheringState state) {
    auto s = weak.lock();
    if (s && state == rtc::PeerConnection::GatheringState::Complete) s->gathered.store(true);
  });
}

RtcPeerEndpoint::~RtcPeerEndpoint() { close(); }

Status RtcPeerEndpoint::add_recv_video(VideoFrameCallback on_frame) {
  try {
    rtc::Description::Video media("video", rtc::Description::Direction::RecvOnly);
    media.addH264Codec(kH264PayloadType);
    video_track_ = pc_->addTrack(media);

    if (!on_frame) return Status::ok_status();  // declared for the remote side, media dropped

    {
      std::lock_guard<std::mutex> lock(shared_->video_mu);
      shared_->on_frame = std::move(on_frame);
      DW_RETURN_IF_ERROR(shared_->decoder.open());
      shared_->decoder_open = true;
    }

    auto depacketizer = std::make_shared<rtc::H264RtpDepacketizer>();
    depacketizer->addToChain(std::make_shared<rtc::RtcpReceivingSession>());
    video_track_->setMediaHandler(depacketizer);

    std::weak_ptr<rtc::Track> weak_track = video_track_;
    video_track_->onOpen([weak_track]() {
      if (auto t = weak_track.lock()) t->requestKeyframe();
    });

    std::weak_ptr<Shared> weak = shared_;
    video_track_->onFrame([weak](rtc::binary data, rtc::FrameInfo) {
      auto s = weak.lock();
      if (!s || s->closing.load()) return;
      std::lock_guard<std::mutex> lock(s->video_mu);
      if (!s->decoder_open || !s->on_frame) return;
      const Status st = s->decoder.decode(data.data(), data.size(), s->on_frame);
      if (!st.ok()) spdlog::debug("RtcPeerEndpoint: {}", st.message());
    });
    return Status::ok_status();
  } catch (const std::exception& e) {
    return Status::internal(std::string("add video track: ") + e.what());
  }
}

Status RtcPeerEndpoint::add_recv_audio() {
  try {
    rtc::Description::Audio media("audio", rtc::Description::Direction::RecvOnly);
    media.addOpusCodec(kOpusPayloadType);
    audio_recv_track_ = pc_->addTrack(media);
    return Status::ok_status();
  } catch (const std::exception& e) {
    return Status::internal(std::string("add audio track: ") + e.what());
  }
}

Status RtcPeerEndpoint::add_send_audio(std::unique_ptr<TimedAudioSource> source) {
  if (!source) return Status::invalid_argument("add_send_audio: source is null");
  if (audio_thread_.joinable()) return Status::invalid_argument("add_send_audio: already added");

  try {
    rtc::Description::Audio media("audio", rtc::Description::Direction::SendOnly);
    media.addOpusCodec(kOpusPayloadType);
    media.addSSRC(kAudioSsrc, "audio", "doorwatch", "audio");
    audio_send_track_ = pc_->addTrack(media);

    auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
        kAudioSsrc, "audio", kOpusPayloadType, rtc::OpusRtpPacketizer::DefaultClockRate);
    auto packetizer = std::make_shared<rtc::OpusRtpPacketizer>(rtp_config);
    packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
    packetizer->addToChain(std::make_shared<rtc::RtcpNackResponder>());
    audio_send_track_->setMediaHandler(packetizer);
  } catch (const std::exception& e) {
    return Status::internal(std::string("add send audio track: ") + e.what());
  }

  audio_thread_ = std::thread(&RtcPeerEndpoint::audio_loop_, this, std::move(source));
  return Status::ok_status();
}

void RtcPeerEndpoint::audio_loop_(std::unique_ptr<TimedAudioSource> source) {
  OpusFrameEncoder opus;
  const Status opened = opus.open(source->sample_rate());
  if (!opened.ok()) {
    spdlog::error("RtcPeerEndpoint: {}", opened.message());
    shared_->audio_failed.store(true);
    return;
  }

  auto track = audio_send_track_;
  while (!shared_->closing.load() && !track->isOpen()) {
    if (shared_->failed.load()) return;
    std::this_thread::sleep_for(kTrackOpenPoll);
  }

  std::uint64_t sent = 0;
  while (!shared_->closing.load() && track->isOpen()) {
    AudioFrame frame = source->next();
    auto packet = opus.encode(frame);
    if (!packet.ok()) {
      spdlog::error("RtcPeerEndpoint: {}", packet.status().message());
      shared_->audio_failed.store(true);
      return;
    }

    const std::chrono::duration<double> at(static_cast<double>(frame.pts) / frame.sample_rate);
    try {
      track->sendFrame(reinterpret_cast<const std::byte*>(packet->data()), packet->size(),
                       rtc::FrameInfo(at));
      ++sent;
    } catch (const std::exception& e) {
      spdlog::warn("RtcPeerEndpoint: audio send failed: {}", e.what());
      shared_->audio_failed.store(true);
      return;
    }
  }
  if (!shared_->closing.load()) {
    spdlog::warn("RtcPeerEndpoint: audio track closed after {} frames", sent);
    shared_->audio_failed.store(true);
    return;
  }
  spdlog::debug("RtcPeerEndpoint: audio loop done after {} frames", sent);
}

Result<SessionId> RtcPeerEndpoint::create_offer() {
  try {
    pc_->setLocalDescription(rtc::Description::Type::Offer);
    auto desc = pc_->localDescription();
    if (!desc) return Result<SessionId>::err(Status::internal("no local description after offer"));
    return parse_sdp_session_id(std::string(*desc));
  } catch (const std::exception& e) {
    return Result<SessionId>::err(Status::internal(std::string("create offer: ") + e.what()));
  }
}

bool RtcPeerEndpoint::gathering_complete() const { return shared_->gathered.load(); }

Result<std::string> RtcPeerEndpoint::local_sdp() const {
  auto desc = pc_->localDescription();
  if (!desc) return Result<std::string>::err(Status::internal("no local description"));
  return Result<std::string>::ok(std::string(*desc));
}

Status RtcPeerEndpoint::apply_answer(const std::string& answer_sdp) {
  try {
    pc_->setRemoteDescription(rtc::Description(answer_sdp, "answer"));
    return Status::ok_status();
  } catch (const std::exception& e) {
    return Status::rejected(std::string("set remote description: ") + e.what());
  }
}

bool RtcPeerEndpoint::connected() const { return shared_->connected.load(); }

bool RtcPeerEndpoint::failed() const { return shared_->failed.load(); }

bool RtcPeerEndpoint::audio_failed() const { return shared_->audio_failed.load(); }

void RtcPeerEndpoint::close() {
  if (closed_) return;
  closed_ = true;

  shared_->closing.store(true);
  if (audio_thread_.joinable()) audio_thread_.join();

  try {
    pc_->close();
  } catch (const std::exception& e) {
    spdlog::warn("RtcPeerEndpoint: close failed: {}", e.what());
  }

  {
    std::lock_guard<std::mutex> lock(shared_->video_mu);
    shared_->on_frame = nullptr;
  }
  video_track_.reset();
  audio_recv_track_.reset();
  audio_send_track_.reset();
}

// -----------------------------
// Factory
// -----------------------------

RtcPeerEndpointFactory::RtcPeerEndpointFactory(CaptureConfig cfg) : cfg_(std::move(cfg)) {}

std::unique_ptr<PeerEndpoint> RtcPeerEndpointFactory::create() {
  try {
    return std::make_unique<RtcPeerEndpoint>(cfg_);
  } catch (const std::exception& e) {
    spdlog::error("RtcPeerEndpointFactory: {}", e.what());
    return nullptr;
  }
}

void init_rtc_logging() {
  rtc::InitLogger(rtc::LogLevel::Warning, [](rtc::LogLevel level, std::string message) {
    switch (level) {
      case rtc::LogLevel::Fatal:
      case rtc::LogLevel::Error:
        spdlog::error("libdatachannel: {}", message);
        break;
      case rtc::LogLevel::Warning:
        spdlog::warn("libdatachannel: {}", message);
        break;
      default:
        spdlog::debug("libdatachannel: {}", message);
        break;
    }
  });
  rtc::Preload();
}

}  // namespace dw
