// include/dw/core/config.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Units policy:
// - Time durations in nanoseconds (int64) internally; YAML keys carry an _s / _ms suffix
// - Audio in 16-bit mono PCM at alert.sample_rate

// -----------------------------
// Device registry (Ring REST)
// -----------------------------
struct RingConfig {
  // JSON token file written by the account setup tool (access_token, refresh_token, ...).
  std::string auth_file = "ring_auth.json";
  std::string api_base = "https://api.ring.com";
  std::string user_agent = "doorwatch/1.0";

  // Empty monitors every doorbell on the account.
  std::string device_name;

  int history_limit = 15;
  double request_timeout_s = 10.0;
};

// -----------------------------
// Motion gating
// -----------------------------
struct MotionConfig {
  DurationNs cooldown_ns = seconds_to_ns(30.0);

  // Seen-set bound: once size exceeds the threshold, keep only the newest `keep`.
  std::size_t seen_trim_threshold = 100;
  std::size_t seen_trim_keep = 50;
};

// -----------------------------
// Frame capture
// -----------------------------
struct CaptureConfig {
  // One deadline for ICE gathering, offer/answer and first usable frame.
  DurationNs frame_timeout_ns = seconds_to_ns(15.0);

  // Leading decoded frames dropped while the stream settles.
  int skip_frames = 5;

  int ice_poll_ms = 100;
  int jpeg_quality = 85;

  // Empty disables STUN (host candidates only).
  std::string stun_server = "stun:stun.l.google.com:19302";
};

// -----------------------------
// Alert playback
// -----------------------------
struct AlertConfig {
  bool enabled = true;
  std::string sound_file = "./sound_effects/alert.mp3";
  double duration_s = 3.0;
  double drain_margin_s = 0.5;
  int sample_rate = 48000;
};

// -----------------------------
// Classifier (OpenAI-compatible chat completions)
// -----------------------------
struct ClassifierConfig {
  std::string api_key;  // mandatory; OPENAI_API_KEY overrides
  std::string endpoint = "https://api.openai.com/v1/chat/completions";
  std::string model = "gpt-4o";
  int max_tokens = 1024;
  double request_timeout_s = 60.0;
};

// -----------------------------
// Storage sinks
// -----------------------------
struct StorageConfig {
  // Empty disables the cloud upload; local save always runs for suspicious frames.
  std::string drive_folder_id;
  std::string drive_token_file = "google_token.json";
  std::string drive_upload_url =
      "https://www.googleapis.com/upload/drive/v3/files?uploadType=multipart&fields=id,webViewLink";

  std::string local_dir = "./flagged_images";
};

// -----------------------------
// Notification sinks (email, webhook)
// -----------------------------
struct NotifyConfig {
  std::string smtp_url = "smtp://smtp.gmail.com:587";
  std::string sender_email;
  std::string app_password;
  std::vector<std::string> recipients;

  // Optional automation webhook (n8n or similar) that receives every captured still.
  std::string webhook_url;
  double webhook_timeout_s = 30.0;

  [[nodiscard]] bool configured() const noexcept {
    return !app_password.empty() && !recipients.empty();
  }
};

// -----------------------------
// Signal ingestion / scheduling
// -----------------------------
enum class MonitorMode {
  kPoll,
  kPush,
};

struct MonitorConfig {
  MonitorMode mode = MonitorMode::kPoll;

  DurationNs scan_interval_ns = seconds_to_ns(10.0);

  // Bounded pipeline concurrency. Accepted signals beyond max_queued are dropped.
  int workers = 4;
  int max_queued = 16;

  double max_run_s = 0.0;  // 0 disables

  // Push mode: local WebSocket ingest for an external push bridge.
  int push_listen_port = 8765;
};

// -----------------------------
// Output (events + logs)
// -----------------------------
struct OutputConfig {
  // Where to write the event journal.
  std::string out_dir = "out";

  // Keep this many per-run journal files.
  std::size_t keep_runs = 50;

  std::string log_level = "info";  // trace | debug | info | warn | error
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  RingConfig ring;
  MotionConfig motion;
  CaptureConfig capture;
  AlertConfig alert;
  ClassifierConfig classifier;
  StorageConfig storage;
  NotifyConfig notify;
  MonitorConfig monitor;
  OutputConfig output;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.motion.cooldown_ns <= 0) {
    return Status::invalid_argument("motion.cooldown_s must be > 0");
  }
  if (cfg.motion.seen_trim_keep == 0 ||
      cfg.motion.seen_trim_keep >= cfg.motion.seen_trim_threshold) {
    return Status::invalid_argument("motion.seen_trim_keep must be in (0, seen_trim_threshold)");
  }
  if (cfg.capture.frame_timeout_ns <= 0) {
    return Status::invalid_argument("capture.frame_timeout_s must be > 0");
  }
  if (cfg.capture.skip_frames < 0) {
    return Status::invalid_argument("capture.skip_frames must be >= 0");
  }
  if (cfg.capture.ice_poll_ms <= 0) {
    return Status::invalid_argument("capture.ice_poll_ms must be > 0");
  }
  if (cfg.capture.jpeg_quality < 1 || cfg.capture.jpeg_quality > 100) {
    return Status::invalid_argument("capture.jpeg_quality must be in [1, 100]");
  }
  if (cfg.alert.duration_s <= 0.0) {
    return Status::invalid_argument("alert.duration_s must be > 0");
  }
  if (cfg.alert.drain_margin_s < 0.0) {
    return Status::invalid_argument("alert.drain_margin_s must be >= 0");
  }
  if (cfg.alert.sample_rate != 48000) {
    return Status::invalid_argument("alert.sample_rate must be 48000 (Opus clock)");
  }
  if (cfg.classifier.max_tokens <= 0) {
    return Status::invalid_argument("classifier.max_tokens must be > 0");
  }
  if (cfg.notify.webhook_timeout_s <= 0.0) {
    return Status::invalid_argument("notify.webhook_timeout_s must be > 0");
  }
  if (cfg.storage.local_dir.empty()) {
    return Status::invalid_argument("storage.local_dir must not be empty");
  }
  if (cfg.ring.history_limit <= 0) {
    return Status::invalid_argument("ring.history_limit must be > 0");
  }
  if (cfg.monitor.scan_interval_ns <= 0) {
    return Status::invalid_argument("monitor.scan_interval_s must be > 0");
  }
  if (cfg.monitor.workers <= 0) {
    return Status::invalid_argument("monitor.workers must be > 0");
  }
  if (cfg.monitor.max_queued < 0) {
    return Status::invalid_argument("monitor.max_queued must be >= 0");
  }
  if (cfg.monitor.max_run_s < 0.0) {
    return Status::invalid_argument("monitor.max_run_s must be >= 0");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  return Status::ok_status();
}

// Startup-only check: the classifier credential is the one mandatory secret.
inline Status validate_credentials(const Config& cfg) {
  if (cfg.classifier.api_key.empty()) {
    return Status::invalid_argument(
        "classifier.api_key is not set (set it in the config or export OPENAI_API_KEY)");
  }
  return Status::ok_status();
}

}  // namespace dw
