// File: include/dw/adapters/webhook/webhook_forwarder.hpp
#pragma once

#include <memory>
#include <string>

#include "dw/adapters/http/http_client.hpp"
#include "dw/core/config.hpp"
#include "dw/core/sinks/image_sink.hpp"

namespace dw {

// {doorbell_name, doorbell_id, timestamp (YYYYmmdd_HHMMSS local), image_base64}
std::string build_webhook_payload(const Device& device, const Frame& frame);

// POSTs each captured still to an automation webhook (n8n "ring-motion" style). Only a 200
// counts as delivered.
class WebhookForwarder final : public FrameForwarder {
 public:
  WebhookForwarder(NotifyConfig cfg, std::shared_ptr<HttpClient> http);

  Status forward(const Device& device, const Frame& frame) override;

 private:
  NotifyConfig cfg_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace dw
