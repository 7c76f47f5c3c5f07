// File: include/dw/core/pipeline/detection_pipeline.hpp
#pragma once

#include <memory>
#include <string>

#include "dw/core/analysis/classifier.hpp"
#include "dw/core/events/run_journal.hpp"
#include "dw/core/io/frame.hpp"
#include "dw/core/media/device_endpoint.hpp"
#include "dw/core/media/media_session_manager.hpp"
#include "dw/core/motion/motion_event_tracker.hpp"
#include "dw/core/sinks/image_sink.hpp"
#include "dw/core/sinks/notifier.hpp"
#include "dw/core/types.hpp"

namespace dw {

enum class PipelineStage {
  kGated,
  kCapturing,
  kForwarding,
  kClassifying,
  kAlerting,
  kUploading,
  kSaving,
  kNotifying,
  kDone,
};

enum class PipelineOutcome {
  kRejected,       // gate said no; nothing else ran
  kCaptureFailed,  // no frame; no classification, no side effects
  kSuspicious,
  kDelivery,
  kBenign,
};

const char* pipeline_stage_name(PipelineStage s) noexcept;
const char* pipeline_outcome_name(PipelineOutcome o) noexcept;

// Collaborators of one pipeline. Null optional sinks are simply skipped.
struct PipelineDeps {
  MotionEventTracker& tracker;
  MediaSessionManager& sessions;
  Classifier& classifier;
  LocalImageStore& local_store;

  ImageUploader* uploader = nullptr;  // set only when an upload destination is configured
  Notifier* notifier = nullptr;       // set only when a transport is configured
  FrameForwarder* forwarder = nullptr;  // set only when a webhook is configured
  RunJournal* journal = nullptr;
};

struct AlertOptions {
  std::shared_ptr<const AudioClip> clip;  // null disables playback
  double duration_s = 3.0;
};

// Motion signal -> gate -> frame -> (forward) -> classification -> side effects.
//
// A configured forwarder receives every captured frame; its failure never blocks classification.
// Branches run in priority order and only one of them runs:
//   suspicious: alert clip, upload (if configured), local save, thief notification
//   delivery:   delivered notification only
//   otherwise:  log
// Each side effect is isolated: a failing or throwing step is logged and the next one still
// runs, so the local save of a suspicious frame never depends on the upload.
//
// Stateless apart from the shared tracker; one instance serves every worker.
class DetectionPipeline {
 public:
  DetectionPipeline(PipelineDeps deps, AlertOptions alert);

  // Step 1 alone; cheap, safe to call on the ingestion thread.
  bool gate(const MotionSignal& signal);

  // Steps 2-4 for a signal that already passed the gate.
  PipelineOutcome process(const MotionSignal& signal, const Device& device, DeviceEndpoint& remote);

  // gate() then process().
  PipelineOutcome run(const MotionSignal& signal, const Device& device, DeviceEndpoint& remote);

  // "ring_<device name>_<YYYYmmdd_HHMMSS>.jpg" with path-hostile characters replaced by '_'.
  static std::string image_filename(const std::string& device_name, TimestampNs wall);

 private:
  ClassificationResult classify_(const MotionSignal& signal, const Frame& frame);
  void handle_suspicious_(const MotionSignal& signal, const Device& device, DeviceEndpoint& remote,
                          const Frame& frame, const ClassificationResult& result);
  void handle_delivery_(const MotionSignal& signal, const ClassificationResult& result);

  template <typename Fn>
  bool isolated_step_(PipelineStage stage, const MotionSignal& signal, Fn&& fn);

  void journal_(const std::string& type, const MotionSignal& signal, const std::string& message);

  PipelineDeps deps_;
  AlertOptions alert_;
};

}  // namespace dw
