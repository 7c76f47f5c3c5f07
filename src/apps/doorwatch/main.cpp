// File: src/apps/doorwatch/main.cpp
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "dw/adapters/audio/alert_clip_loader.hpp"
#include "dw/adapters/drive/drive_uploader.hpp"
#include "dw/adapters/email/smtp_notifier.hpp"
#include "dw/adapters/http/http_client.hpp"
#include "dw/adapters/openai/openai_classifier.hpp"
#include "dw/adapters/push/ws_signal_listener.hpp"
#include "dw/adapters/ring/ring_client.hpp"
#include "dw/adapters/rtc/rtc_peer_endpoint.hpp"
#include "dw/adapters/webhook/webhook_forwarder.hpp"
#include "dw/core/events/jsonl_event_sink.hpp"
#include "dw/core/events/run_journal.hpp"
#include "dw/core/media/media_session_manager.hpp"
#include "dw/core/motion/motion_event_tracker.hpp"
#include "dw/core/pipeline/detection_pipeline.hpp"
#include "dw/core/pipeline/motion_monitor.hpp"
#include "dw/core/sinks/image_sink.hpp"
#include "dw/core/util/config_loader.hpp"
#include "dw/core/util/worker_pool.hpp"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "doorwatch\n"
            << "  --config <path>\n"
            << "\n"
            << "Secrets may come from the environment: OPENAI_API_KEY, EMAIL_APP_PASSWORD, ...\n";
}

const char* mode_name(dw::MonitorMode m) {
  return m == dw::MonitorMode::kPush ? "push" : "poll";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = dw::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  dw::Config cfg = cfg_r.take_value();

  const dw::Status st_creds = dw::validate_credentials(cfg);
  if (!st_creds.ok()) {
    std::cerr << st_creds.message() << "\n";
    return 1;
  }

  spdlog::set_level(spdlog::level::from_str(cfg.output.log_level));
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");

  dw::CurlGlobal curl;
  if (!curl.ok()) {
    std::cerr << "libcurl global init failed\n";
    return 2;
  }
  dw::init_rtc_logging();

  auto http = std::make_shared<dw::HttpClient>(cfg.ring.user_agent);

  dw::RingClient ring(cfg.ring, http);
  const dw::Status st_token = ring.load_token();
  if (!st_token.ok()) {
    std::cerr << st_token.message() << "\n";
    return 1;
  }

  std::shared_ptr<const dw::AudioClip> clip;
  if (cfg.alert.enabled) {
    auto clip_r = dw::load_alert_clip(cfg.alert.sound_file, cfg.alert.duration_s, cfg.alert.sample_rate);
    if (clip_r.ok()) {
      clip = std::make_shared<const dw::AudioClip>(clip_r.take_value());
    } else {
      spdlog::warn("Alert playback disabled: {}", clip_r.status().message());
    }
  }

  dw::JsonlEventSink sink;
  dw::RunJournal journal(sink, cfg.output.out_dir, cfg.output.keep_runs);

  dw::RtcPeerEndpointFactory peers(cfg.capture);
  dw::MediaSessionManager sessions(peers, cfg.capture, cfg.alert.drain_margin_s);
  dw::MotionEventTracker tracker(cfg.motion);
  dw::OpenAiClassifier classifier(cfg.classifier, http);
  dw::LocalImageStore local_store(cfg.storage.local_dir);

  std::unique_ptr<dw::DriveUploader> uploader;
  if (!cfg.storage.drive_folder_id.empty()) {
    uploader = std::make_unique<dw::DriveUploader>(cfg.storage, http);
  } else {
    spdlog::info("No Drive folder configured; flagged images are saved locally only");
  }

  std::unique_ptr<dw::SmtpNotifier> notifier;
  if (cfg.notify.configured()) {
    notifier = std::make_unique<dw::SmtpNotifier>(cfg.notify);
  } else {
    spdlog::info("Email notifications not configured");
  }

  std::unique_ptr<dw::WebhookForwarder> forwarder;
  if (!cfg.notify.webhook_url.empty()) {
    forwarder = std::make_unique<dw::WebhookForwarder>(cfg.notify, http);
    spdlog::info("Forwarding captured frames to {}", cfg.notify.webhook_url);
  }

  dw::PipelineDeps deps{tracker, sessions, classifier, local_store};
  deps.uploader = uploader.get();
  deps.notifier = notifier.get();
  deps.forwarder = forwarder.get();
  deps.journal = &journal;

  dw::AlertOptions alert;
  alert.clip = clip;
  alert.duration_s = cfg.alert.duration_s;

  dw::DetectionPipeline pipeline(deps, alert);
  dw::WorkerPool pool("pipeline", cfg.monitor.workers, static_cast<std::size_t>(cfg.monitor.max_queued));
  dw::MotionMonitor monitor(ring, pipeline, pool, cfg.monitor, cfg.ring.history_limit, &journal);

  std::unique_ptr<dw::WsSignalListener> listener;

  // Ensure we always drain workers and close the journal.
  struct Guard {
    std::unique_ptr<dw::WsSignalListener>& l;
    dw::WorkerPool& p;
    dw::RunJournal& j;
    ~Guard() {
      if (l) l->stop();
      p.stop();
      j.stop();
    }
  } guard{listener, pool, journal};

  const dw::Status st_devices = monitor.refresh_devices();
  if (!st_devices.ok()) {
    spdlog::error("Initial device refresh failed: {}", st_devices.message());
    return 1;
  }
  const auto devices = monitor.known_devices();
  if (devices.empty()) {
    spdlog::error("No doorbells found{}",
                  cfg.ring.device_name.empty() ? std::string() : " named '" + cfg.ring.device_name + "'");
    return 1;
  }
  for (const auto& d : devices) {
    spdlog::info("Monitoring {} (id={}, two-way audio: {})", d.name, d.id, d.supports_two_way_audio ? "yes" : "no");
  }

  dw::RunInfo run;
  run.config_path = args.config_path;
  run.mode = mode_name(cfg.monitor.mode);
  run.device_count = devices.size();
  const dw::Status st_start = journal.start(run);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  if (cfg.monitor.mode == dw::MonitorMode::kPush) {
    listener = std::make_unique<dw::WsSignalListener>(monitor, cfg.monitor.push_listen_port);
    const dw::Status st_listen = listener->start();
    if (!st_listen.ok()) {
      spdlog::error("{}", st_listen.message());
      return 2;
    }
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  std::cout << "Mode: " << mode_name(cfg.monitor.mode) << "  devices=" << devices.size()
            << "  workers=" << cfg.monitor.workers << "\n\n";

  monitor.run([] { return g_stop != 0; });

  std::cout << "OK\n";
  return 0;
}
