// File: include/dw/adapters/push/ws_signal_listener.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dw/core/pipeline/motion_monitor.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace rtc {
class WebSocket;
class WebSocketServer;
}  // namespace rtc

namespace dw {

// One push message: {"device_id": ..., "event_id": ..., "kind": "motion"}.
// kUnsupported for any other kind, kParseError for malformed text.
Result<MotionSignal> parse_push_signal(const std::string& text);

// Local WebSocket ingest for push mode. Every text message is one event; the listener replies
// {"accepted": bool, "reason": "..."} on the same socket.
class WsSignalListener {
 public:
  WsSignalListener(MotionMonitor& monitor, int port);
  ~WsSignalListener();

  WsSignalListener(const WsSignalListener&) = delete;
  WsSignalListener& operator=(const WsSignalListener&) = delete;

  Status start();
  // Idempotent. Open client sockets are closed outside clients_mu_, since their onClosed
  // handlers take it.
  void stop();

  // Bound port once started (resolves port 0), else the configured one.
  int port() const;

  // Parse + dispatch; returns the reply text. Exposed for the socket callback.
  std::string handle_message(const std::string& text);

 private:
  MotionMonitor& monitor_;
  int port_;

  std::unique_ptr<rtc::WebSocketServer> server_;
  std::mutex clients_mu_;
  std::unordered_map<rtc::WebSocket*, std::shared_ptr<rtc::WebSocket>> clients_;
};

}  // namespace dw
