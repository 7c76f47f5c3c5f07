// File: src/adapters/webhook/webhook_forwarder.cpp
#include "dw/adapters/webhook/webhook_forwarder.hpp"

#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dw/core/util/base64.hpp"
#include "dw/core/util/time.hpp"

namespace dw {

using json = nlohmann::json;

std::string build_webhook_payload(const Device& device, const Frame& frame) {
  const json body = {
      {"doorbell_name", device.name},
      {"doorbell_id", device.id},
      {"timestamp", format_compact_local(frame.captured_at)},
      {"image_base64", base64_encode(frame.jpeg)},
  };
  return body.dump();
}

WebhookForwarder::WebhookForwarder(NotifyConfig cfg, std::shared_ptr<HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

Status WebhookForwarder::forward(const Device& device, const Frame& frame) {
  if (cfg_.webhook_url.empty()) return Status::unavailable("webhook: no URL configured");
  if (frame.jpeg.empty()) return Status::invalid_argument("webhook: refusing to forward an empty image");

  HttpRequest req;
  req.method = "POST";
  req.url = cfg_.webhook_url;
  req.headers = {"Content-Type: application/json"};
  req.body = build_webhook_payload(device, frame);
  req.timeout_s = cfg_.webhook_timeout_s;

  auto resp = http_->perform(req);
  if (!resp.ok()) return resp.status();
  if (resp->status != 200) {
    spdlog::error("WebhookForwarder: webhook returned {}", resp->status);
    return Status::unavailable("webhook: " + describe_http_failure(resp.value()));
  }
  spdlog::info("WebhookForwarder: sent {} snapshot ({} bytes)", device.name, frame.size());
  return Status::ok_status();
}

}  // namespace dw
