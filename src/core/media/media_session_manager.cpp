// File: src/core/media/media_session_manager.cpp
#include "dw/core/media/media_session_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "dw/core/util/time.hpp"

namespace dw {
namespace {

using Clock = std::chrono::steady_clock;

// Single-resolution slot for the captured still. The first frame past the warm-up count
// resolves it; later frames and later fail() calls are ignored.
class FrameLatch {
 public:
  FrameLatch(int skip_frames, int jpeg_quality)
      : skip_frames_(skip_frames), jpeg_quality_(jpeg_quality), future_(promise_.get_future()) {}

  void offer(const VideoFrame& picture) {
    std::lock_guard<std::mutex> lock(mu_);
    if (resolved_) return;
    if (seen_++ < skip_frames_) return;

    auto jpeg = picture.to_jpeg(jpeg_quality_);
    if (!jpeg.ok()) {
      resolve_locked_(Result<Frame>::err(jpeg.status()));
      return;
    }

    Frame frame;
    frame.captured_at = wall_now_ns();
    frame.jpeg = jpeg.take_value();
    resolve_locked_(Result<Frame>::ok(std::move(frame)));
  }

  std::future<Result<Frame>>& future() { return future_; }

 private:
  void resolve_locked_(Result<Frame> r) {
    resolved_ = true;
    promise_.set_value(std::move(r));
  }

  std::mutex mu_;
  int skip_frames_;
  int jpeg_quality_;
  int seen_{0};
  bool resolved_{false};
  std::promise<Result<Frame>> promise_;
  std::future<Result<Frame>> future_;
};

// Teardown + close on every way out of a session call.
struct SessionCleanup {
  CaptureSession& session;
  PeerEndpoint& local;
  DeviceEndpoint& remote;

  ~SessionCleanup() {
    if (!session.session_id.empty()) {
      try {
        const Status st = remote.teardown(session.session_id);
        if (!st.ok()) {
          spdlog::warn("MediaSession: teardown of {} on {} failed: {}", session.session_id,
                       session.device_id, st.message());
        }
      } catch (const std::exception& e) {
        spdlog::warn("MediaSession: teardown of {} on {} threw: {}", session.session_id,
                     session.device_id, e.what());
      }
    }
    local.close();
    spdlog::debug("MediaSession: {} on {} closed after {}", session.session_id, session.device_id,
                  session_state_name(session.state));
    session.state = SessionState::kClosed;
  }
};

std::chrono::milliseconds remaining_ms(const CaptureSession& s) {
  const auto left = s.deadline - Clock::now();
  return std::max(std::chrono::milliseconds(0),
                  std::chrono::duration_cast<std::chrono::milliseconds>(left));
}

Status mark(CaptureSession& session, Status st) {
  if (st.ok()) {
    session.state = SessionState::kSucceeded;
  } else if (st.code() == Status::Code::kTimeout) {
    session.state = SessionState::kTimedOut;
  } else {
    session.state = SessionState::kFailed;
  }
  return st;
}

}  // namespace

const char* session_state_name(SessionState s) noexcept {
  switch (s) {
    case SessionState::kNegotiating: return "negotiating";
    case SessionState::kConnected: return "connected";
    case SessionState::kSucceeded: return "succeeded";
    case SessionState::kTimedOut: return "timed_out";
    case SessionState::kFailed: return "failed";
    case SessionState::kClosed: return "closed";
  }
  return "unknown";
}

MediaSessionManager::MediaSessionManager(PeerEndpointFactory& factory, CaptureConfig cfg,
                                         double drain_margin_s)
    : factory_(factory), cfg_(std::move(cfg)), drain_margin_s_(drain_margin_s) {}

Status MediaSessionManager::negotiate_(CaptureSession& session, PeerEndpoint& local,
                                       DeviceEndpoint& remote) {
  auto sid = local.create_offer();
  if (!sid.ok()) return sid.status();
  session.session_id = sid.take_value();

  // The remote peer rejects offers without the full candidate set.
  const auto poll = std::chrono::milliseconds(cfg_.ice_poll_ms);
  while (!local.gathering_complete()) {
    if (Clock::now() >= session.deadline) {
      return Status::timeout("ICE gathering did not complete before the deadline");
    }
    std::this_thread::sleep_for(std::min(poll, remaining_ms(session)));
  }

  auto offer = local.local_sdp();
  if (!offer.ok()) return offer.status();

  const DurationNs left =
      std::chrono::duration_cast<std::chrono::nanoseconds>(session.deadline - Clock::now()).count();
  if (left <= 0) return Status::timeout("no time left for the offer/answer exchange");

  auto answer = remote.negotiate(session.session_id, offer.value(), left);
  if (!answer.ok()) {
    const Status& st = answer.status();
    if (st.code() == Status::Code::kTimeout || st.code() == Status::Code::kNoResponse) return st;
    return Status::rejected("offer/answer exchange failed: " + st.message());
  }
  if (answer->empty()) {
    return Status::no_response("device returned an empty answer");
  }
  if (Clock::now() >= session.deadline) {
    return Status::timeout("offer/answer exchange finished past the deadline");
  }

  const Status applied = local.apply_answer(answer.value());
  if (!applied.ok()) {
    return Status::rejected("remote answer not applicable: " + applied.message());
  }
  return Status::ok_status();
}

Status MediaSessionManager::wait_connected_(CaptureSession& session, PeerEndpoint& local) {
  const auto poll = std::chrono::milliseconds(cfg_.ice_poll_ms);
  while (!local.connected()) {
    if (local.failed()) return Status::no_response("transport failed before connecting");
    if (Clock::now() >= session.deadline) {
      return Status::timeout("transport did not connect before the deadline");
    }
    std::this_thread::sleep_for(std::min(poll, remaining_ms(session)));
  }
  session.state = SessionState::kConnected;
  return Status::ok_status();
}

Result<Frame> MediaSessionManager::pull_frame(const Device& device, DeviceEndpoint& remote) {
  return pull_frame(device, remote, cfg_.frame_timeout_ns);
}

Result<Frame> MediaSessionManager::pull_frame(const Device& device, DeviceEndpoint& remote,
                                              DurationNs frame_timeout) {
  CaptureSession session;
  session.device_id = device.id;
  session.direction = CaptureDirection::kPullVideo;
  session.deadline = Clock::now() + std::chrono::nanoseconds(frame_timeout);

  std::unique_ptr<PeerEndpoint> local = factory_.create();
  if (!local) return Result<Frame>::err(Status::internal("peer endpoint factory returned null"));

  spdlog::info("MediaSession: connecting to live stream on {}", device.name);

  auto latch = std::make_shared<FrameLatch>(cfg_.skip_frames, cfg_.jpeg_quality);

  SessionCleanup cleanup{session, *local, remote};
  try {
    Status st = local->add_recv_video([latch](const VideoFrame& picture) { latch->offer(picture); });
    if (st.ok()) st = local->add_recv_audio();
    if (st.ok()) st = negotiate_(session, *local, remote);
    if (!st.ok()) return Result<Frame>::err(mark(session, st));

    // One deadline covers negotiation and the first usable frame.
    auto& fut = latch->future();
    const auto poll = std::chrono::milliseconds(cfg_.ice_poll_ms);
    while (true) {
      if (fut.wait_for(std::min(poll, remaining_ms(session))) == std::future_status::ready) break;
      if (local->connected()) session.state = SessionState::kConnected;
      if (local->failed()) {
        return Result<Frame>::err(
            mark(session, Status::no_response("stream closed before the first frame")));
      }
      if (Clock::now() >= session.deadline) {
        return Result<Frame>::err(
            mark(session, Status::timeout("no video frame before the deadline")));
      }
    }

    Result<Frame> frame = fut.get();
    if (!frame.ok()) return Result<Frame>::err(mark(session, frame.status()));

    mark(session, Status::ok_status());
    spdlog::info("MediaSession: captured live frame from {}: {} bytes", device.name, frame->size());
    return frame;
  } catch (const std::exception& e) {
    return Result<Frame>::err(
        mark(session, Status::internal(std::string("live stream capture failed: ") + e.what())));
  }
}

Status MediaSessionManager::push_audio_clip(const Device& device, DeviceEndpoint& remote,
                                            std::unique_ptr<TimedAudioSource> source,
                                            double duration_s) {
  if (!source) return Status::invalid_argument("push_audio_clip: source is null");

  CaptureSession session;
  session.device_id = device.id;
  session.direction = CaptureDirection::kPushAudio;
  session.deadline = Clock::now() + std::chrono::nanoseconds(cfg_.frame_timeout_ns);

  std::unique_ptr<PeerEndpoint> local = factory_.create();
  if (!local) return Status::internal("peer endpoint factory returned null");

  SessionCleanup cleanup{session, *local, remote};
  try {
    Status st = local->add_send_audio(std::move(source));
    // The remote peer insists on a video m-line even though nothing is watched.
    if (st.ok()) st = local->add_recv_video(PeerEndpoint::VideoFrameCallback{});
    if (st.ok()) st = negotiate_(session, *local, remote);
    if (st.ok()) st = wait_connected_(session, *local);
    if (!st.ok()) return mark(session, st);

    spdlog::info("MediaSession: streaming audio to {} for {:.1f}s", device.name, duration_s);

    // Hold for the clip plus a margin so the last buffered frames drain.
    const auto hold_until =
        Clock::now() + std::chrono::duration_cast<Clock::duration>(
                           std::chrono::duration<double>(duration_s + drain_margin_s_));
    const auto poll = std::chrono::milliseconds(cfg_.ice_poll_ms);
    while (Clock::now() < hold_until) {
      if (local->failed()) {
        return mark(session, Status::no_response("transport dropped during playback"));
      }
      if (local->audio_failed()) {
        return mark(session, Status::unavailable("alert audio stopped before the clip finished"));
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(hold_until - Clock::now());
      std::this_thread::sleep_for(std::max(std::chrono::milliseconds(0), std::min(poll, left)));
    }

    spdlog::info("MediaSession: alert audio finished on {}", device.name);
    return mark(session, Status::ok_status());
  } catch (const std::exception& e) {
    return mark(session, Status::internal(std::string("audio push failed: ") + e.what()));
  }
}

}  // namespace dw
