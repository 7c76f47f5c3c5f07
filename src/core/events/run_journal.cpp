// File: src/core/events/run_journal.cpp
#include "dw/core/events/run_journal.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "dw/core/util/time.hpp"

namespace dw {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;

  return std::stoll(mid);
}

}  // namespace

RunJournal::RunJournal(EventSink& sink, std::string out_dir, std::size_t keep_runs)
    : sink_(sink), out_dir_(std::move(out_dir)), keep_runs_(keep_runs) {}

TimestampNs RunJournal::since_start_ns() const {
  if (!started_) return TimestampNs{0};
  const auto now = std::chrono::steady_clock::now();
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void RunJournal::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_events_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status RunJournal::start(RunInfo run) {
  // Leave room for the file this run is about to create.
  prune_out_dir(out_dir_, keep_runs_ > 0 ? keep_runs_ - 1 : 0);

  t0_steady_ = std::chrono::steady_clock::now();

  run.out_dir = out_dir_;
  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = wall_now_ns();

  DW_RETURN_IF_ERROR(sink_.open(run));
  started_ = true;
  return Status::ok_status();
}

Status RunJournal::emit(const std::string& type, const std::string& message) {
  return emit(type, DeviceId{}, EventId{}, message);
}

Status RunJournal::emit(const std::string& type, const DeviceId& device_id,
                        const EventId& event_id, const std::string& message) {
  if (!started_) return Status::ok_status();

  Event e;
  e.type = type;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_ns();
  e.device_id = device_id;
  e.event_id = event_id;
  e.message = message;
  return sink_.emit(e);
}

void RunJournal::stop() {
  if (!started_.exchange(false)) return;
  (void)sink_.flush();
  sink_.close();
}

}  // namespace dw
