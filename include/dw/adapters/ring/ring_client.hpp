// File: include/dw/adapters/ring/ring_client.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dw/adapters/http/http_client.hpp"
#include "dw/core/config.hpp"
#include "dw/core/media/device_endpoint.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// -----------------------------
// Ring REST payloads
// -----------------------------

// access_token from the auth file written by the account setup tool.
Result<std::string> parse_ring_access_token(const std::string& auth_json);

// Doorbells from GET /clients_api/ring_devices ("doorbots" + "authorized_doorbots").
// Empty `name_filter` keeps all of them.
Result<std::vector<Device>> parse_ring_devices(const std::string& body, const std::string& name_filter);

// Motion entries from GET /clients_api/doorbots/<id>/history, newest first as returned.
// Other kinds (ding, on_demand, ...) are dropped.
Result<std::vector<MotionSignal>> parse_ring_history(const std::string& body, const DeviceId& device_id);

// "sdp" from the liveview/start response.
Result<std::string> parse_liveview_answer(const std::string& body);

// -----------------------------
// Client
// -----------------------------

// DeviceRegistry over the Ring REST API. The bearer token is read once from ring.auth_file;
// token refresh is the setup tool's job.
class RingClient final : public DeviceRegistry {
 public:
  RingClient(RingConfig cfg, std::shared_ptr<HttpClient> http);

  // Must succeed before anything else is called.
  Status load_token();

  Status refresh() override;
  std::vector<Device> doorbells() const override;
  Result<std::vector<MotionSignal>> recent_motion(const Device& device, int limit) override;
  std::shared_ptr<DeviceEndpoint> endpoint(const Device& device) override;

  // Authorized JSON POST against api_base; shared with the live-view endpoint. A positive
  // `timeout_s` tightens ring.request_timeout_s, never loosens it.
  Result<HttpResponse> post_json(const std::string& path, const std::string& json_body,
                                 double timeout_s = 0.0) const;

 private:
  Result<HttpResponse> get_(const std::string& path) const;
  std::vector<std::string> auth_headers_() const;

  RingConfig cfg_;
  std::shared_ptr<HttpClient> http_;
  std::string access_token_;

  mutable std::mutex mu_;
  std::vector<Device> devices_;
};

// Live-view offer/answer for one doorbell.
class RingLiveView final : public DeviceEndpoint {
 public:
  RingLiveView(const RingClient& client, Device device);

  Result<std::string> negotiate(const SessionId& session_id, const std::string& offer_sdp,
                                DurationNs budget) override;
  Status teardown(const SessionId& session_id) override;

 private:
  const RingClient& client_;
  Device device_;
};

}  // namespace dw
