// File: tests/test_fakes.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dw/core/analysis/classifier.hpp"
#include "dw/core/events/event_sink.hpp"
#include "dw/core/media/device_endpoint.hpp"
#include "dw/core/media/peer_endpoint.hpp"
#include "dw/core/sinks/image_sink.hpp"
#include "dw/core/sinks/notifier.hpp"

namespace dw::testing {

inline std::string make_temp_dir(const std::string& tag) {
  namespace fs = std::filesystem;
  static std::atomic<int> counter{0};
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path p = fs::temp_directory_path() /
                     ("dw_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
  fs::create_directories(p);
  return p.string();
}

inline const char* kOfferSdp =
    "v=0\r\n"
    "o=rtc 4107523824 0 IN IP4 127.0.0.1\r\n"
    "s=-\r\n"
    "t=0 0\r\n";

// -----------------------------
// Media
// -----------------------------

class FakeVideoFrame final : public VideoFrame {
 public:
  explicit FakeVideoFrame(int index, bool broken = false) : index_(index), broken_(broken) {}

  Result<std::vector<std::uint8_t>> to_jpeg(int) const override {
    if (broken_) return Result<std::vector<std::uint8_t>>::err(Status::corrupt_data("bad picture"));
    return Result<std::vector<std::uint8_t>>::ok(
        {0xFF, 0xD8, static_cast<std::uint8_t>(index_), 0xFF, 0xD9});
  }

 private:
  int index_;
  bool broken_;
};

// Scripted local endpoint behaviour, shared by every endpoint a factory creates.
struct PeerScript {
  bool offer_fails = false;
  bool gathers = true;
  bool connects = true;
  bool fails_after_answer = false;
  bool answer_rejected = false;
  bool broken_pictures = false;
  bool throw_on_answer = false;
  bool audio_fails = false;  // outbound audio stops once connected
  int pictures_on_answer = 0;  // delivered synchronously from apply_answer
};

struct PeerCounters {
  std::atomic<int> created{0};
  std::atomic<int> closed{0};
  std::atomic<int> audio_sessions{0};
  std::atomic<int> video_sessions{0};
};

class FakePeerEndpoint final : public PeerEndpoint {
 public:
  FakePeerEndpoint(const PeerScript& script, PeerCounters& counters)
      : script_(script), counters_(counters) {}

  Status add_recv_video(VideoFrameCallback on_frame) override {
    on_frame_ = std::move(on_frame);
    if (on_frame_) ++counters_.video_sessions;
    return Status::ok_status();
  }
  Status add_recv_audio() override { return Status::ok_status(); }
  Status add_send_audio(std::unique_ptr<TimedAudioSource> source) override {
    source_ = std::move(source);
    ++counters_.audio_sessions;
    return Status::ok_status();
  }

  Result<SessionId> create_offer() override {
    if (script_.offer_fails) return Result<SessionId>::err(Status::internal("no offer"));
    return Result<SessionId>::ok("4107523824");
  }
  bool gathering_complete() const override { return script_.gathers; }
  Result<std::string> local_sdp() const override { return Result<std::string>::ok(kOfferSdp); }

  Status apply_answer(const std::string&) override {
    if (script_.throw_on_answer) throw std::runtime_error("transport exploded");
    if (script_.answer_rejected) return Status::invalid_argument("bad answer");
    answered_ = true;
    for (int i = 0; i < script_.pictures_on_answer; ++i) {
      if (on_frame_) on_frame_(FakeVideoFrame(i, script_.broken_pictures));
    }
    return Status::ok_status();
  }

  bool connected() const override { return answered_ && script_.connects; }
  bool failed() const override { return answered_ && script_.fails_after_answer; }
  bool audio_failed() const override { return answered_ && source_ && script_.audio_fails; }

  void close() override { ++counters_.closed; }

 private:
  PeerScript script_;
  PeerCounters& counters_;
  VideoFrameCallback on_frame_;
  std::unique_ptr<TimedAudioSource> source_;
  bool answered_{false};
};

class FakePeerFactory final : public PeerEndpointFactory {
 public:
  PeerScript script;
  PeerCounters counters;

  std::unique_ptr<PeerEndpoint> create() override {
    ++counters.created;
    return std::make_unique<FakePeerEndpoint>(script, counters);
  }
};

class FakeDeviceEndpoint final : public DeviceEndpoint {
 public:
  std::string answer = "v=0\r\no=- 1 1 IN IP4 10.0.0.2\r\n";
  Status negotiate_status;  // ok -> return `answer`
  Status teardown_status;
  bool teardown_throws = false;
  DurationNs exchange_delay = 0;  // simulated round trip; honours the caller's budget

  Result<std::string> negotiate(const SessionId& session_id, const std::string&,
                                DurationNs budget) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      negotiated_.push_back(session_id);
      budgets_.push_back(budget);
    }
    if (exchange_delay > 0) {
      std::this_thread::sleep_for(std::chrono::nanoseconds(std::min(exchange_delay, budget)));
      if (exchange_delay > budget) {
        return Result<std::string>::err(Status::timeout("exchange exceeded its budget"));
      }
    }
    if (!negotiate_status.ok()) return Result<std::string>::err(negotiate_status);
    return Result<std::string>::ok(answer);
  }

  Status teardown(const SessionId& session_id) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      torn_down_.push_back(session_id);
    }
    if (teardown_throws) throw std::runtime_error("teardown exploded");
    return teardown_status;
  }

  std::vector<SessionId> negotiated() const {
    std::lock_guard<std::mutex> lock(mu_);
    return negotiated_;
  }
  std::vector<SessionId> torn_down() const {
    std::lock_guard<std::mutex> lock(mu_);
    return torn_down_;
  }
  std::vector<DurationNs> budgets() const {
    std::lock_guard<std::mutex> lock(mu_);
    return budgets_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<SessionId> negotiated_;
  std::vector<SessionId> torn_down_;
  std::vector<DurationNs> budgets_;
};

// -----------------------------
// Registry
// -----------------------------

class FakeRegistry final : public DeviceRegistry {
 public:
  std::vector<Device> devices;
  std::map<DeviceId, std::vector<MotionSignal>> history;
  std::map<DeviceId, Status> history_errors;
  DeviceId throwing_device;
  Status refresh_status;
  std::shared_ptr<FakeDeviceEndpoint> remote = std::make_shared<FakeDeviceEndpoint>();
  std::atomic<int> refreshes{0};

  Status refresh() override {
    ++refreshes;
    return refresh_status;
  }
  std::vector<Device> doorbells() const override { return devices; }

  Result<std::vector<MotionSignal>> recent_motion(const Device& device, int limit) override {
    if (device.id == throwing_device) throw std::runtime_error("history exploded");
    const auto err = history_errors.find(device.id);
    if (err != history_errors.end()) return Result<std::vector<MotionSignal>>::err(err->second);
    std::vector<MotionSignal> out;
    const auto it = history.find(device.id);
    if (it != history.end()) {
      for (const auto& s : it->second) {
        if (static_cast<int>(out.size()) >= limit) break;
        out.push_back(s);
      }
    }
    return Result<std::vector<MotionSignal>>::ok(std::move(out));
  }

  std::shared_ptr<DeviceEndpoint> endpoint(const Device&) override { return remote; }
};

// -----------------------------
// Analysis + sinks
// -----------------------------

class FakeClassifier final : public Classifier {
 public:
  ClassificationResult result;
  bool throws = false;
  std::atomic<int> calls{0};

  ClassificationResult classify(const Frame&) override {
    ++calls;
    if (throws) throw std::runtime_error("model unavailable");
    return result;
  }
};

class FakeUploader final : public ImageUploader {
 public:
  Status fail_with;
  std::mutex mu;
  std::vector<std::string> filenames;
  std::vector<std::string> metadata;

  Result<std::string> upload(const std::vector<std::uint8_t>&, const std::string& filename,
                             const std::string& metadata_json) override {
    std::lock_guard<std::mutex> lock(mu);
    filenames.push_back(filename);
    metadata.push_back(metadata_json);
    if (!fail_with.ok()) return Result<std::string>::err(fail_with);
    return Result<std::string>::ok("drive-file-1");
  }
};

class FakeForwarder final : public FrameForwarder {
 public:
  Status fail_with;
  std::mutex mu;
  std::vector<std::string> device_ids;
  std::vector<std::size_t> sizes;

  Status forward(const Device& device, const Frame& frame) override {
    std::lock_guard<std::mutex> lock(mu);
    device_ids.push_back(device.id);
    sizes.push_back(frame.size());
    return fail_with;
  }
};

class FakeNotifier final : public Notifier {
 public:
  bool throws = false;
  std::mutex mu;
  std::vector<NotificationKind> kinds;
  std::vector<std::string> descriptions;

  Status notify(NotificationKind kind, const std::string& description) override {
    std::lock_guard<std::mutex> lock(mu);
    kinds.push_back(kind);
    descriptions.push_back(description);
    if (throws) throw std::runtime_error("smtp exploded");
    return Status::ok_status();
  }
};

// -----------------------------
// Journal
// -----------------------------

class MemoryEventSink final : public EventSink {
 public:
  Status open(const RunInfo& run) override {
    std::lock_guard<std::mutex> lock(mu_);
    run_ = run;
    open_ = true;
    return Status::ok_status();
  }
  Status emit(const Event& e) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (!open_) return Status::invalid_argument("not open");
    events_.push_back(e);
    return Status::ok_status();
  }
  Status flush() override { return Status::ok_status(); }
  void close() override {
    std::lock_guard<std::mutex> lock(mu_);
    open_ = false;
  }

  std::vector<Event> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

  int count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mu_);
    int n = 0;
    for (const auto& e : events_) n += e.type == type ? 1 : 0;
    return n;
  }

  std::string message_of(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : events_) {
      if (e.type == type) return e.message;
    }
    return {};
  }

  RunInfo run() const {
    std::lock_guard<std::mutex> lock(mu_);
    return run_;
  }

 private:
  mutable std::mutex mu_;
  bool open_{false};
  RunInfo run_;
  std::vector<Event> events_;
};

}  // namespace dw::testing
