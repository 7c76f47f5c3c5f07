// File: src/adapters/push/ws_signal_listener.cpp
#include "dw/adapters/push/ws_signal_listener.hpp"

#include <cstdint>
#include <exception>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>
#include <rtc/rtc.hpp>
#include <spdlog/spdlog.h>

#include "dw/core/util/time.hpp"

namespace dw {
namespace {

using json = nlohmann::json;

std::string field_text(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end()) return {};
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_unsigned()) return std::to_string(it->get<std::uint64_t>());
  if (it->is_number_integer()) return std::to_string(it->get<std::int64_t>());
  return {};
}

std::string reply(bool accepted, const std::string& reason) {
  return json{{"accepted", accepted}, {"reason", reason}}.dump();
}

}  // namespace

Result<MotionSignal> parse_push_signal(const std::string& text) {
  using R = Result<MotionSignal>;
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) return R::err(Status::parse_error("push message is not a JSON object"));

  const std::string kind = field_text(j, "kind");
  if (kind != "motion") return R::err(Status::unsupported("ignored event kind '" + kind + "'"));

  MotionSignal s;
  s.device_id = field_text(j, "device_id");
  s.event_id = field_text(j, "event_id");
  if (s.device_id.empty() || s.event_id.empty()) {
    return R::err(Status::parse_error("push message needs device_id and event_id"));
  }
  s.observed_at = wall_now_ns();
  return R::ok(std::move(s));
}

WsSignalListener::WsSignalListener(MotionMonitor& monitor, int port) : monitor_(monitor), port_(port) {}

WsSignalListener::~WsSignalListener() { stop(); }

std::string WsSignalListener::handle_message(const std::string& text) {
  auto sig = parse_push_signal(text);
  if (!sig.ok()) {
    if (sig.status().code() == Status::Code::kUnsupported) {
      spdlog::debug("WsSignalListener: {}", sig.status().message());
    } else {
      spdlog::warn("WsSignalListener: {}", sig.status().message());
    }
    return reply(false, sig.status().message());
  }
  const bool accepted = monitor_.dispatch(sig.value());
  return reply(accepted, accepted ? "dispatched" : "gated");
}

Status WsSignalListener::start() {
  try {
    rtc::WebSocketServer::Configuration config;
    config.port = static_cast<uint16_t>(port_);
    config.enableTls = false;
    server_ = std::make_unique<rtc::WebSocketServer>(config);

    server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
      {
        std::lock_guard<std::mutex> lock(clients_mu_);
        clients_[ws.get()] = ws;
      }
      std::weak_ptr<rtc::WebSocket> weak = ws;

      ws->onMessage([this, weak](auto data) {
        if (!std::holds_alternative<std::string>(data)) return;
        const std::string answer = handle_message(std::get<std::string>(data));
        if (auto sock = weak.lock()) sock->send(answer);
      });
      ws->onError([](std::string error) { spdlog::warn("WsSignalListener: socket error: {}", error); });
      ws->onClosed([this, weak]() {
        std::lock_guard<std::mutex> lock(clients_mu_);
        if (auto sock = weak.lock()) clients_.erase(sock.get());
      });
    });
  } catch (const std::exception& e) {
    server_.reset();
    return Status::unavailable(std::string("push listener failed to start: ") + e.what());
  }

  spdlog::info("WsSignalListener: listening on port {}", port());
  return Status::ok_status();
}

int WsSignalListener::port() const { return server_ ? static_cast<int>(server_->port()) : port_; }

void WsSignalListener::stop() {
  if (!server_) return;
  server_->stop();

  std::unordered_map<rtc::WebSocket*, std::shared_ptr<rtc::WebSocket>> open;
  {
    std::lock_guard<std::mutex> lock(clients_mu_);
    open.swap(clients_);
  }
  for (auto& [raw, ws] : open) {
    try {
      if (ws) ws->close();
    } catch (const std::exception& e) {
      spdlog::warn("WsSignalListener: closing client failed: {}", e.what());
    }
  }
  server_.reset();
}

}  // namespace dw
