// File: src/core/events/jsonl_event_sink.cpp
#include "dw/core/events/jsonl_event_sink.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace dw {
namespace {

using json = nlohmann::json;

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

}  // namespace

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  std::lock_guard<std::mutex> lock(mu_);

  path_ = join_path(run.out_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  const json header = {
      {"type", "run_started"},
      {"t_ns", t0},
      {"t_s", ns_to_s(t0)},
      {"t_wall_ns", wall0},
      {"t_wall_s", ns_to_s(wall0)},
      {"mode", run.mode},
      {"device_count", run.device_count},
      {"config_path", run.config_path},
  };

  DW_RETURN_IF_ERROR(write_line_(header.dump(-1, ' ', false, json::error_handler_t::replace)));
  return flush_locked_();
}

Status JsonlEventSink::emit(const Event& e) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  json line = {
      {"type", e.type},
      {"t_ns", e.t_ns.ns},
      {"t_s", ns_to_s(e.t_ns.ns)},
      {"t_wall_ns", e.t_wall_ns.ns},
      {"t_wall_s", ns_to_s(e.t_wall_ns.ns)},
  };
  if (!e.device_id.empty()) line["device_id"] = e.device_id;
  if (!e.event_id.empty()) line["event_id"] = e.event_id;
  if (!e.message.empty()) line["message"] = e.message;

  // Journal lines are rare (a handful per motion event); flush each so a crash loses nothing.
  DW_RETURN_IF_ERROR(write_line_(line.dump(-1, ' ', false, json::error_handler_t::replace)));
  return flush_locked_();
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  std::lock_guard<std::mutex> lock(mu_);
  return flush_locked_();
}

Status JsonlEventSink::flush_locked_() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace dw
