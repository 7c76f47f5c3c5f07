// File: src/adapters/ring/ring_client.cpp
#include "dw/adapters/ring/ring_client.hpp"

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dw/core/util/time.hpp"

namespace dw {
namespace {

using json = nlohmann::json;

Result<json> parse_object(const std::string& body, const char* what) {
  json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return Result<json>::err(Status::parse_error(std::string(what) + ": not JSON"));
  return Result<json>::ok(std::move(j));
}

// Ring ids are JSON numbers (occasionally strings); keep them as decimal text.
std::string id_to_string(const json& v) {
  if (v.is_number_unsigned()) return std::to_string(v.get<std::uint64_t>());
  if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
  if (v.is_string()) return v.get<std::string>();
  return {};
}

// "2024-05-01T12:34:56.000Z" -> wall epoch ns. Fractional seconds and offset are ignored.
std::optional<TimestampNs> parse_created_at(const json& v) {
  if (!v.is_string()) return std::nullopt;
  std::tm tm{};
  std::istringstream in(v.get<std::string>());
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) return std::nullopt;
  const std::time_t secs = timegm(&tm);
  if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
  return TimestampNs{static_cast<std::int64_t>(secs) * 1'000'000'000};
}

void append_doorbells(const json& arr, const std::string& name_filter, std::vector<Device>& out) {
  if (!arr.is_array()) return;
  for (const auto& d : arr) {
    if (!d.is_object()) continue;
    Device dev;
    dev.id = id_to_string(d.value("id", json()));
    dev.name = d.value("description", std::string());
    if (dev.id.empty()) continue;
    if (!name_filter.empty() && dev.name != name_filter) continue;
    // Peephole models have no speaker on the outside.
    const std::string kind = d.value("kind", std::string());
    dev.supports_two_way_audio = kind.find("peephole") == std::string::npos;
    out.push_back(std::move(dev));
  }
}

}  // namespace

Result<std::string> parse_ring_access_token(const std::string& auth_json) {
  auto j = parse_object(auth_json, "ring auth file");
  if (!j.ok()) return Result<std::string>::err(j.status());
  const json& root = j.value();
  if (!root.is_object() || !root.contains("access_token") || !root["access_token"].is_string()) {
    return Result<std::string>::err(Status::parse_error("ring auth file: missing access_token"));
  }
  std::string token = root["access_token"].get<std::string>();
  if (token.empty()) return Result<std::string>::err(Status::parse_error("ring auth file: empty access_token"));
  return Result<std::string>::ok(std::move(token));
}

Result<std::vector<Device>> parse_ring_devices(const std::string& body, const std::string& name_filter) {
  auto j = parse_object(body, "ring_devices");
  if (!j.ok()) return Result<std::vector<Device>>::err(j.status());
  const json& root = j.value();
  if (!root.is_object()) {
    return Result<std::vector<Device>>::err(Status::parse_error("ring_devices: expected an object"));
  }

  std::vector<Device> out;
  append_doorbells(root.value("doorbots", json::array()), name_filter, out);
  append_doorbells(root.value("authorized_doorbots", json::array()), name_filter, out);
  return Result<std::vector<Device>>::ok(std::move(out));
}

Result<std::vector<MotionSignal>> parse_ring_history(const std::string& body, const DeviceId& device_id) {
  auto j = parse_object(body, "history");
  if (!j.ok()) return Result<std::vector<MotionSignal>>::err(j.status());
  const json& root = j.value();
  if (!root.is_array()) {
    return Result<std::vector<MotionSignal>>::err(Status::parse_error("history: expected an array"));
  }

  std::vector<MotionSignal> out;
  for (const auto& e : root) {
    if (!e.is_object()) continue;
    if (e.value("kind", std::string()) != "motion") continue;
    MotionSignal s;
    s.device_id = device_id;
    s.event_id = id_to_string(e.value("id", json()));
    if (s.event_id.empty()) continue;
    s.observed_at = parse_created_at(e.value("created_at", json())).value_or(wall_now_ns());
    out.push_back(std::move(s));
  }
  return Result<std::vector<MotionSignal>>::ok(std::move(out));
}

Result<std::string> parse_liveview_answer(const std::string& body) {
  auto j = parse_object(body, "liveview/start");
  if (!j.ok()) return Result<std::string>::err(j.status());
  const json& root = j.value();
  if (!root.is_object() || !root.contains("sdp") || !root["sdp"].is_string()) {
    return Result<std::string>::err(Status::no_response("liveview/start: no sdp in response"));
  }
  return Result<std::string>::ok(root["sdp"].get<std::string>());
}

// -----------------------------
// RingClient
// -----------------------------

RingClient::RingClient(RingConfig cfg, std::shared_ptr<HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

Status RingClient::load_token() {
  std::ifstream f(cfg_.auth_file);
  if (!f.is_open()) {
    return Status::not_found("Ring auth file not found: " + cfg_.auth_file +
                             " (run the account setup tool first)");
  }
  std::ostringstream ss;
  ss << f.rdbuf();

  auto token = parse_ring_access_token(ss.str());
  if (!token.ok()) return token.status();
  access_token_ = token.take_value();
  return Status::ok_status();
}

std::vector<std::string> RingClient::auth_headers_() const {
  return {
      "Authorization: Bearer " + access_token_,
      "Accept: application/json",
  };
}

Result<HttpResponse> RingClient::get_(const std::string& path) const {
  HttpRequest req;
  req.method = "GET";
  req.url = cfg_.api_base + path;
  req.headers = auth_headers_();
  req.timeout_s = cfg_.request_timeout_s;
  return http_->perform(req);
}

Result<HttpResponse> RingClient::post_json(const std::string& path, const std::string& json_body,
                                           double timeout_s) const {
  HttpRequest req;
  req.method = "POST";
  req.url = cfg_.api_base + path;
  req.headers = auth_headers_();
  req.headers.push_back("Content-Type: application/json");
  req.body = json_body;
  req.timeout_s = cfg_.request_timeout_s;
  if (timeout_s > 0.0) req.timeout_s = std::min(req.timeout_s, timeout_s);
  return http_->perform(req);
}

Status RingClient::refresh() {
  if (access_token_.empty()) return Status::unavailable("ring: token not loaded");

  auto resp = get_("/clients_api/ring_devices");
  if (!resp.ok()) return resp.status();
  if (resp->status == 401) return Status::permission_denied("ring: token rejected (re-run the setup tool)");
  if (!resp->success()) return Status::unavailable("ring_devices: " + describe_http_failure(resp.value()));

  auto devices = parse_ring_devices(resp->body, cfg_.device_name);
  if (!devices.ok()) return devices.status();

  std::lock_guard<std::mutex> lock(mu_);
  devices_ = devices.take_value();
  return Status::ok_status();
}

std::vector<Device> RingClient::doorbells() const {
  std::lock_guard<std::mutex> lock(mu_);
  return devices_;
}

Result<std::vector<MotionSignal>> RingClient::recent_motion(const Device& device, int limit) {
  auto resp = get_("/clients_api/doorbots/" + device.id + "/history?limit=" + std::to_string(limit));
  if (!resp.ok()) return Result<std::vector<MotionSignal>>::err(resp.status());
  if (!resp->success()) {
    return Result<std::vector<MotionSignal>>::err(
        Status::unavailable("history: " + describe_http_failure(resp.value())));
  }
  return parse_ring_history(resp->body, device.id);
}

std::shared_ptr<DeviceEndpoint> RingClient::endpoint(const Device& device) {
  return std::make_shared<RingLiveView>(*this, device);
}

// -----------------------------
// RingLiveView
// -----------------------------

RingLiveView::RingLiveView(const RingClient& client, Device device)
    : client_(client), device_(std::move(device)) {}

Result<std::string> RingLiveView::negotiate(const SessionId& session_id, const std::string& offer_sdp,
                                            DurationNs budget) {
  const double budget_s = static_cast<double>(budget) / 1e9;
  if (budget_s < 0.001) {
    return Result<std::string>::err(Status::timeout("liveview/start: no time left before the deadline"));
  }
  const json body = {
      {"session_id", session_id},
      {"device_id", device_.id},
      {"sdp", offer_sdp},
      {"protocol", "webrtc"},
  };
  auto resp = client_.post_json("/integrations/v1/liveview/start", body.dump(), budget_s);
  if (!resp.ok()) return Result<std::string>::err(resp.status());
  if (!resp->success()) {
    return Result<std::string>::err(
        Status::rejected("liveview/start: " + describe_http_failure(resp.value())));
  }
  return parse_liveview_answer(resp->body);
}

Status RingLiveView::teardown(const SessionId& session_id) {
  const json body = {{"session_id", session_id}};
  auto resp = client_.post_json("/integrations/v1/liveview/end", body.dump());
  if (!resp.ok()) return resp.status();
  if (!resp->success()) return Status::unavailable("liveview/end: " + describe_http_failure(resp.value()));
  spdlog::debug("RingLiveView: session {} on {} ended", session_id, device_.name);
  return Status::ok_status();
}

}  // namespace dw
