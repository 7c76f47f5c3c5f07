// File: include/dw/core/media/media_session_manager.hpp
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "dw/core/config.hpp"
#include "dw/core/io/frame.hpp"
#include "dw/core/media/device_endpoint.hpp"
#include "dw/core/media/peer_endpoint.hpp"
#include "dw/core/media/timed_audio_source.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

enum class CaptureDirection {
  kPullVideo,
  kPushAudio,
};

enum class SessionState {
  kNegotiating,
  kConnected,
  kSucceeded,
  kTimedOut,
  kFailed,
  kClosed,
};

const char* session_state_name(SessionState s) noexcept;

// One negotiation, owned by the pull_frame / push_audio_clip call that created it.
struct CaptureSession {
  DeviceId device_id;
  SessionId session_id;  // empty until the local offer exists
  CaptureDirection direction = CaptureDirection::kPullVideo;
  std::chrono::steady_clock::time_point deadline;
  SessionState state = SessionState::kNegotiating;
};

// Negotiates one short-lived session per request.
//
// Every exit path (success, timeout, error, exception) converges on the same cleanup: one
// best-effort remote teardown by session id, then the local endpoint is closed. Teardown errors
// are logged and never change the call's result.
//
// Failures: kRejected (offer/answer refused), kTimeout (deadline hit), kNoResponse (remote
// answered nothing usable or dropped before the first frame).
class MediaSessionManager {
 public:
  MediaSessionManager(PeerEndpointFactory& factory, CaptureConfig cfg, double drain_margin_s = 0.5);

  Result<Frame> pull_frame(const Device& device, DeviceEndpoint& remote);
  Result<Frame> pull_frame(const Device& device, DeviceEndpoint& remote, DurationNs frame_timeout);

  // Holds the session open for duration_s + drain margin once connected.
  Status push_audio_clip(const Device& device, DeviceEndpoint& remote,
                         std::unique_ptr<TimedAudioSource> source, double duration_s);

 private:
  Status negotiate_(CaptureSession& session, PeerEndpoint& local, DeviceEndpoint& remote);
  Status wait_connected_(CaptureSession& session, PeerEndpoint& local);

  PeerEndpointFactory& factory_;
  CaptureConfig cfg_;
  double drain_margin_s_;
};

}  // namespace dw
