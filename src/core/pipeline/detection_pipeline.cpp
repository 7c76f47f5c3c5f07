// File: src/core/pipeline/detection_pipeline.cpp
#include "dw/core/pipeline/detection_pipeline.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "dw/core/media/timed_audio_source.hpp"
#include "dw/core/util/time.hpp"

namespace dw {

const char* pipeline_stage_name(PipelineStage s) noexcept {
  switch (s) {
    case PipelineStage::kGated: return "gated";
    case PipelineStage::kCapturing: return "capturing";
    case PipelineStage::kForwarding: return "forwarding";
    case PipelineStage::kClassifying: return "classifying";
    case PipelineStage::kAlerting: return "alerting";
    case PipelineStage::kUploading: return "uploading";
    case PipelineStage::kSaving: return "saving";
    case PipelineStage::kNotifying: return "notifying";
    case PipelineStage::kDone: return "done";
  }
  return "unknown";
}

const char* pipeline_outcome_name(PipelineOutcome o) noexcept {
  switch (o) {
    case PipelineOutcome::kRejected: return "rejected";
    case PipelineOutcome::kCaptureFailed: return "capture_failed";
    case PipelineOutcome::kSuspicious: return "suspicious";
    case PipelineOutcome::kDelivery: return "delivery";
    case PipelineOutcome::kBenign: return "benign";
  }
  return "unknown";
}

DetectionPipeline::DetectionPipeline(PipelineDeps deps, AlertOptions alert)
    : deps_(std::move(deps)), alert_(std::move(alert)) {}

std::string DetectionPipeline::image_filename(const std::string& device_name, TimestampNs wall) {
  std::string name = "ring_" + device_name + "_" + format_compact_local(wall) + ".jpg";
  for (char& c : name) {
    if (c == ' ' || c == '/' || c == '\\') c = '_';
  }
  return name;
}

void DetectionPipeline::journal_(const std::string& type, const MotionSignal& signal,
                                 const std::string& message) {
  if (!deps_.journal) return;
  const Status st = deps_.journal->emit(type, signal.device_id, signal.event_id, message);
  if (!st.ok()) spdlog::debug("DetectionPipeline: journal write failed: {}", st.message());
}

template <typename Fn>
bool DetectionPipeline::isolated_step_(PipelineStage stage, const MotionSignal& signal, Fn&& fn) {
  spdlog::debug("DetectionPipeline: [{}] {}", signal.device_id, pipeline_stage_name(stage));
  std::string error;
  try {
    const Status st = fn();
    if (st.ok()) return true;
    error = st.message();
  } catch (const std::exception& e) {
    error = e.what();
  }
  spdlog::error("DetectionPipeline: [{}] {} failed: {}", signal.device_id,
                pipeline_stage_name(stage), error);
  journal_("sink_failed", signal, std::string(pipeline_stage_name(stage)) + ": " + error);
  return false;
}

bool DetectionPipeline::gate(const MotionSignal& signal) {
  const GateDecision d = deps_.tracker.evaluate_at(signal.device_id, signal.event_id, steady_now_ns());
  switch (d) {
    case GateDecision::kAccepted:
      journal_("motion_accepted", signal, "");
      return true;
    case GateDecision::kCooldown:
      journal_("motion_rejected", signal, gate_decision_name(d));
      return false;
    case GateDecision::kDuplicate:
      // Poll re-scans replay every recent id; not worth a journal line.
      return false;
  }
  return false;
}

PipelineOutcome DetectionPipeline::run(const MotionSignal& signal, const Device& device,
                                       DeviceEndpoint& remote) {
  if (!gate(signal)) return PipelineOutcome::kRejected;
  return process(signal, device, remote);
}

ClassificationResult DetectionPipeline::classify_(const MotionSignal& signal, const Frame& frame) {
  try {
    return deps_.classifier.classify(frame);
  } catch (const std::exception& e) {
    spdlog::error("DetectionPipeline: [{}] classifier threw: {}", signal.device_id, e.what());
    return safe_default_result(std::string("classifier error: ") + e.what());
  }
}

PipelineOutcome DetectionPipeline::process(const MotionSignal& signal, const Device& device,
                                           DeviceEndpoint& remote) {
  spdlog::info("DetectionPipeline: motion detected on {} (event {})", device.name, signal.event_id);

  // --- capture
  spdlog::debug("DetectionPipeline: [{}] {}", signal.device_id,
                pipeline_stage_name(PipelineStage::kCapturing));
  Result<Frame> frame_r = deps_.sessions.pull_frame(device, remote);
  if (!frame_r.ok()) {
    const Status& st = frame_r.status();
    spdlog::warn("DetectionPipeline: could not capture a frame from {} ({}: {}), skipping analysis",
                 device.name, code_name(st.code()), st.message());
    journal_("capture_failed", signal, std::string(code_name(st.code())) + ": " + st.message());
    return PipelineOutcome::kCaptureFailed;
  }
  const Frame frame = frame_r.take_value();
  journal_("frame_captured", signal, std::to_string(frame.size()) + " bytes");

  if (deps_.forwarder) {
    isolated_step_(PipelineStage::kForwarding, signal, [&]() -> Status {
      DW_RETURN_IF_ERROR(deps_.forwarder->forward(device, frame));
      journal_("forwarded", signal, "");
      return Status::ok_status();
    });
  }

  // --- classify
  spdlog::debug("DetectionPipeline: [{}] {}", signal.device_id,
                pipeline_stage_name(PipelineStage::kClassifying));
  const ClassificationResult result = classify_(signal, frame);
  journal_("classified", signal, classification_to_json(result, -1));

  // --- branch
  PipelineOutcome outcome = PipelineOutcome::kBenign;
  if (result.is_suspicious) {
    spdlog::warn("DetectionPipeline: SUSPICIOUS ACTIVITY DETECTED on {}: {}", device.name,
                 result.description);
    handle_suspicious_(signal, device, remote, frame, result);
    outcome = PipelineOutcome::kSuspicious;
  } else if (result.is_delivery) {
    spdlog::info("DetectionPipeline: package delivery detected on {}: {}", device.name,
                 result.description);
    handle_delivery_(signal, result);
    outcome = PipelineOutcome::kDelivery;
  } else {
    spdlog::info("DetectionPipeline: no suspicious activity on {}: {}", device.name,
                 result.description);
  }

  spdlog::debug("DetectionPipeline: [{}] {} ({})", signal.device_id,
                pipeline_stage_name(PipelineStage::kDone), pipeline_outcome_name(outcome));
  return outcome;
}

void DetectionPipeline::handle_suspicious_(const MotionSignal& signal, const Device& device,
                                           DeviceEndpoint& remote, const Frame& frame,
                                           const ClassificationResult& result) {
  const std::string filename = image_filename(device.name, frame.captured_at);
  const std::string metadata = classification_to_json(result);

  isolated_step_(PipelineStage::kAlerting, signal, [&]() -> Status {
    if (!alert_.clip) {
      spdlog::info("DetectionPipeline: alert playback disabled or no clip loaded");
      return Status::ok_status();
    }
    if (!device.supports_two_way_audio) {
      spdlog::info("DetectionPipeline: {} has no speaker, skipping alert", device.name);
      return Status::ok_status();
    }
    auto source = std::make_unique<TimedAudioSource>(*alert_.clip);
    DW_RETURN_IF_ERROR(deps_.sessions.push_audio_clip(device, remote, std::move(source),
                                                      alert_.duration_s));
    journal_("alert_played", signal, "");
    return Status::ok_status();
  });

  if (deps_.uploader) {
    isolated_step_(PipelineStage::kUploading, signal, [&]() -> Status {
      auto id = deps_.uploader->upload(frame.jpeg, filename, metadata);
      if (!id.ok()) return id.status();
      journal_("uploaded", signal, id.value());
      return Status::ok_status();
    });
  }

  // Always attempted, whatever happened above.
  isolated_step_(PipelineStage::kSaving, signal, [&]() -> Status {
    auto path = deps_.local_store.save_local(frame.jpeg, filename, metadata);
    if (!path.ok()) return path.status();
    journal_("saved_local", signal, path.value());
    return Status::ok_status();
  });

  if (deps_.notifier) {
    isolated_step_(PipelineStage::kNotifying, signal, [&]() -> Status {
      DW_RETURN_IF_ERROR(deps_.notifier->notify(NotificationKind::kThief, result.description));
      journal_("notified", signal, notification_kind_name(NotificationKind::kThief));
      return Status::ok_status();
    });
  }
}

void DetectionPipeline::handle_delivery_(const MotionSignal& signal, const ClassificationResult& result) {
  if (!deps_.notifier) return;
  isolated_step_(PipelineStage::kNotifying, signal, [&]() -> Status {
    DW_RETURN_IF_ERROR(deps_.notifier->notify(NotificationKind::kDelivered, result.description));
    journal_("notified", signal, notification_kind_name(NotificationKind::kDelivered));
    return Status::ok_status();
  });
}

}  // namespace dw
