// File: src/adapters/openai/openai_classifier.cpp
#include "dw/adapters/openai/openai_classifier.hpp"

#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dw/core/util/base64.hpp"

namespace dw {

using json = nlohmann::json;

const char* const kAnalysisPrompt = R"(Analyze this image from a doorbell camera that was triggered by motion.

Your task is to determine if there's a potential package thief in this image or if there is a package being dropped off
by a delivery driver

Look for these suspicious behaviors:
1. Someone picking up a package that was left at the door
2. Someone looking around suspiciously while near packages
3. Someone quickly grabbing something and leaving
4. Someone who doesn't appear to be a delivery person taking or dropping off a package
5. Multiple people where one acts as a lookout

Also consider these innocent scenarios:
- The homeowner retrieving their own package
- A delivery person dropping off a package
- A neighbor or expected visitor
- Just motion from animals, cars, or wind

Respond with a JSON object:
{
    "is_suspicious": true/false,
    "confidence_of_suspicion": "high"/"medium"/"low",
    "is_delivery" : true/false,
    "description": "Brief description of what you see",
    "reason": "Why you flagged or didn't flag this as suspicious"
}

Only set is_suspicious to true if you have medium or high confidence that package theft
is occurring or about to occur. When in doubt, err on the side of caution (false positive
is better than missing a thief).

Only set is_delivery to true if you ascertain that a delivery driver is dropping off a package
)";

std::string build_analysis_request(const ClassifierConfig& cfg, const Frame& frame) {
  const std::string data_url = "data:image/jpeg;base64," + base64_encode(frame.jpeg);
  const json body = {
      {"model", cfg.model},
      {"max_tokens", cfg.max_tokens},
      {"messages",
       json::array({
           {
               {"role", "user"},
               {"content",
                json::array({
                    {{"type", "image_url"}, {"image_url", {{"url", data_url}}}},
                    {{"type", "text"}, {"text", kAnalysisPrompt}},
                })},
           },
       })},
  };
  return body.dump();
}

Result<std::string> extract_reply_text(const std::string& response_body) {
  const json j = json::parse(response_body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return Result<std::string>::err(Status::parse_error("chat completion: response is not a JSON object"));
  }
  const auto choices = j.find("choices");
  if (choices == j.end() || !choices->is_array() || choices->empty()) {
    return Result<std::string>::err(Status::parse_error("chat completion: no choices"));
  }
  const json& first = (*choices)[0];
  if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
    return Result<std::string>::err(Status::parse_error("chat completion: no message"));
  }
  const json& message = first["message"];
  if (!message.contains("content") || !message["content"].is_string()) {
    return Result<std::string>::err(Status::parse_error("chat completion: no text content"));
  }
  return Result<std::string>::ok(message["content"].get<std::string>());
}

OpenAiClassifier::OpenAiClassifier(ClassifierConfig cfg, std::shared_ptr<HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

ClassificationResult OpenAiClassifier::classify(const Frame& frame) {
  spdlog::info("OpenAiClassifier: analyzing {} byte frame with {}", frame.size(), cfg_.model);

  HttpRequest req;
  req.method = "POST";
  req.url = cfg_.endpoint;
  req.headers = {
      "Authorization: Bearer " + cfg_.api_key,
      "Content-Type: application/json",
  };
  req.body = build_analysis_request(cfg_, frame);
  req.timeout_s = cfg_.request_timeout_s;

  auto resp = http_->perform(req);
  if (!resp.ok()) {
    spdlog::error("OpenAiClassifier: request failed: {}", resp.status().message());
    return safe_default_result("classifier request failed: " + resp.status().message());
  }
  if (!resp->success()) {
    const std::string why = describe_http_failure(resp.value());
    spdlog::error("OpenAiClassifier: API error: {}", why);
    return safe_default_result("classifier API error: " + why);
  }

  auto text = extract_reply_text(resp->body);
  if (!text.ok()) {
    spdlog::error("OpenAiClassifier: {}", text.status().message());
    return safe_default_result(text.status().message());
  }

  ClassificationResult result = parse_classification_or_default(text.value());
  spdlog::info("OpenAiClassifier: {}", classification_to_json(result, -1));
  return result;
}

}  // namespace dw
