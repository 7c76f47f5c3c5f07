// src/core/util/config_loader.cpp
#include "dw/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace dw {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static void maybe_set_seconds(const YAML::Node& n, const char* key, DurationNs& out) {
  if (!n || !n[key]) return;
  out = seconds_to_ns(n[key].as<double>());
}

static std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path) {
  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Result<MonitorMode> parse_monitor_mode(const YAML::Node& n) {
  if (!n) return Result<MonitorMode>::ok(MonitorMode::kPoll);
  if (!is_scalar(n)) return Result<MonitorMode>::err(Status::invalid_argument("monitor.mode must be a string"));
  const auto s = to_lower(n.as<std::string>());
  if (s == "poll") return Result<MonitorMode>::ok(MonitorMode::kPoll);
  if (s == "push") return Result<MonitorMode>::ok(MonitorMode::kPush);
  return Result<MonitorMode>::err(Status::invalid_argument("unknown monitor.mode: " + s));
}

static Status fill_config(const YAML::Node& y, Config& cfg) {
  // --- ring
  if (is_map(y["ring"])) {
    const auto r = y["ring"];
    maybe_set(r, "auth_file", cfg.ring.auth_file);
    maybe_set(r, "api_base", cfg.ring.api_base);
    maybe_set(r, "user_agent", cfg.ring.user_agent);
    maybe_set(r, "device_name", cfg.ring.device_name);
    maybe_set(r, "history_limit", cfg.ring.history_limit);
    maybe_set(r, "request_timeout_s", cfg.ring.request_timeout_s);
  }

  // --- motion
  if (is_map(y["motion"])) {
    const auto m = y["motion"];
    maybe_set_seconds(m, "cooldown_s", cfg.motion.cooldown_ns);
    maybe_set(m, "seen_trim_threshold", cfg.motion.seen_trim_threshold);
    maybe_set(m, "seen_trim_keep", cfg.motion.seen_trim_keep);
  }

  // --- capture
  if (is_map(y["capture"])) {
    const auto c = y["capture"];
    maybe_set_seconds(c, "frame_timeout_s", cfg.capture.frame_timeout_ns);
    maybe_set(c, "skip_frames", cfg.capture.skip_frames);
    maybe_set(c, "ice_poll_ms", cfg.capture.ice_poll_ms);
    maybe_set(c, "jpeg_quality", cfg.capture.jpeg_quality);
    maybe_set(c, "stun_server", cfg.capture.stun_server);
  }

  // --- alert
  if (is_map(y["alert"])) {
    const auto a = y["alert"];
    maybe_set(a, "enabled", cfg.alert.enabled);
    maybe_set(a, "sound_file", cfg.alert.sound_file);
    maybe_set(a, "duration_s", cfg.alert.duration_s);
    maybe_set(a, "drain_margin_s", cfg.alert.drain_margin_s);
    maybe_set(a, "sample_rate", cfg.alert.sample_rate);
  }

  // --- classifier
  if (is_map(y["classifier"])) {
    const auto c = y["classifier"];
    maybe_set(c, "api_key", cfg.classifier.api_key);
    maybe_set(c, "endpoint", cfg.classifier.endpoint);
    maybe_set(c, "model", cfg.classifier.model);
    maybe_set(c, "max_tokens", cfg.classifier.max_tokens);
    maybe_set(c, "request_timeout_s", cfg.classifier.request_timeout_s);
  }

  // --- storage
  if (is_map(y["storage"])) {
    const auto s = y["storage"];
    maybe_set(s, "drive_folder_id", cfg.storage.drive_folder_id);
    maybe_set(s, "drive_token_file", cfg.storage.drive_token_file);
    maybe_set(s, "drive_upload_url", cfg.storage.drive_upload_url);
    maybe_set(s, "local_dir", cfg.storage.local_dir);
  }

  // --- notify
  if (is_map(y["notify"])) {
    const auto n = y["notify"];
    maybe_set(n, "smtp_url", cfg.notify.smtp_url);
    maybe_set(n, "sender_email", cfg.notify.sender_email);
    maybe_set(n, "app_password", cfg.notify.app_password);
    maybe_set(n, "webhook_url", cfg.notify.webhook_url);
    maybe_set(n, "webhook_timeout_s", cfg.notify.webhook_timeout_s);
    if (n["recipients"]) {
      if (!n["recipients"].IsSequence()) {
        return Status::invalid_argument("notify.recipients must be a YAML sequence");
      }
      cfg.notify.recipients = n["recipients"].as<std::vector<std::string>>();
    }
  }

  // --- monitor
  if (is_map(y["monitor"])) {
    const auto m = y["monitor"];
    if (m["mode"]) {
      auto mode = parse_monitor_mode(m["mode"]);
      if (!mode.ok()) return mode.status();
      cfg.monitor.mode = mode.take_value();
    }
    maybe_set_seconds(m, "scan_interval_s", cfg.monitor.scan_interval_ns);
    maybe_set(m, "workers", cfg.monitor.workers);
    maybe_set(m, "max_queued", cfg.monitor.max_queued);
    maybe_set(m, "max_run_s", cfg.monitor.max_run_s);
    maybe_set(m, "push_listen_port", cfg.monitor.push_listen_port);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_runs", cfg.output.keep_runs);
    maybe_set(o, "log_level", cfg.output.log_level);
  }
  return Status::ok_status();
}

std::string getenv_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

void apply_env_overrides(Config& cfg, const EnvLookup& env) {
  auto set_if = [&env](const char* name, std::string& out) {
    const std::string v = env(name);
    if (!v.empty()) out = v;
  };

  set_if("OPENAI_API_KEY", cfg.classifier.api_key);
  set_if("GOOGLE_DRIVE_FOLDER_ID", cfg.storage.drive_folder_id);
  set_if("LOCAL_SAVE_DIR", cfg.storage.local_dir);
  set_if("RING_AUTH_FILE", cfg.ring.auth_file);
  set_if("RING_DOORBELL_NAME", cfg.ring.device_name);
  set_if("ALERT_SOUND_FILE", cfg.alert.sound_file);
  set_if("SENDER_EMAIL", cfg.notify.sender_email);
  set_if("EMAIL_APP_PASSWORD", cfg.notify.app_password);
  set_if("N8N_WEBHOOK_URL", cfg.notify.webhook_url);

  const std::string recipients = env("NOTIFICATION_RECIPIENTS");
  if (!recipients.empty()) cfg.notify.recipients = split_csv(recipients);
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults
  try {
    const Status st = fill_config(y, cfg);
    if (!st.ok()) return Result<Config>::err(st);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
  }

  apply_env_overrides(cfg, getenv_or_empty);

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace dw
