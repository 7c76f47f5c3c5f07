// File: include/dw/core/media/peer_endpoint.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dw/core/media/timed_audio_source.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// One decoded inbound video picture. JPEG encoding is deferred so skipped warm-up frames cost
// nothing beyond the decode.
class VideoFrame {
 public:
  virtual ~VideoFrame() = default;

  virtual Result<std::vector<std::uint8_t>> to_jpeg(int quality) const = 0;
};

// Local side of one real-time media session.
//
// Lifecycle: add tracks -> create_offer() -> poll gathering_complete() -> local_sdp()
//            -> apply_answer() -> (media flows) -> close().
// Callbacks may fire on transport threads until close() returns.
class PeerEndpoint {
 public:
  using VideoFrameCallback = std::function<void(const VideoFrame&)>;

  virtual ~PeerEndpoint() = default;

  // Receive-only video. An empty callback still declares the capability but drops media.
  virtual Status add_recv_video(VideoFrameCallback on_frame) = 0;

  // Receive-only audio; inbound media is discarded.
  virtual Status add_recv_audio() = 0;

  // One outbound audio track fed by `source` once the transport is up. The endpoint owns the
  // source from here on and is its only consumer.
  virtual Status add_send_audio(std::unique_ptr<TimedAudioSource> source) = 0;

  // Builds the local offer and starts candidate gathering. The returned id is the session id
  // from the offer's origin line; it is stable from here until close().
  virtual Result<SessionId> create_offer() = 0;

  [[nodiscard]] virtual bool gathering_complete() const = 0;

  // Complete offer including gathered candidates.
  virtual Result<std::string> local_sdp() const = 0;

  virtual Status apply_answer(const std::string& answer_sdp) = 0;

  [[nodiscard]] virtual bool connected() const = 0;

  // Transport failed or was closed by the remote side.
  [[nodiscard]] virtual bool failed() const = 0;

  // The outbound audio track stopped before close() (encoder or send error, track dropped).
  [[nodiscard]] virtual bool audio_failed() const = 0;

  virtual void close() = 0;
};

class PeerEndpointFactory {
 public:
  virtual ~PeerEndpointFactory() = default;

  virtual std::unique_ptr<PeerEndpoint> create() = 0;
};

}  // namespace dw
