// File: src/core/analysis/classification_parser.cpp
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dw/core/analysis/classifier.hpp"

namespace dw {
namespace {

using json = nlohmann::json;

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Text between the first `open` marker and the next ``` after it.
std::string between_fences(const std::string& reply, const std::string& open) {
  const auto start = reply.find(open);
  const auto body = start + open.size();
  const auto end = reply.find("```", body);
  return trim(reply.substr(body, end == std::string::npos ? std::string::npos : end - body));
}

// Models sometimes quote booleans.
bool read_bool(const json& obj, const char* key, bool fallback) {
  const auto it = obj.find(key);
  if (it == obj.end()) return fallback;
  if (it->is_boolean()) return it->get<bool>();
  if (it->is_string()) {
    const std::string s = to_lower(trim(it->get<std::string>()));
    if (s == "true" || s == "yes") return true;
    if (s == "false" || s == "no") return false;
  }
  return fallback;
}

std::string read_string(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

Confidence read_confidence(const json& obj) {
  for (const char* key : {"confidence", "confidence_of_suspicion"}) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) continue;
    const std::string s = to_lower(trim(it->get<std::string>()));
    if (s == "high") return Confidence::kHigh;
    if (s == "medium") return Confidence::kMedium;
    if (s == "low") return Confidence::kLow;
  }
  return Confidence::kLow;
}

}  // namespace

ClassificationResult safe_default_result(std::string reason) {
  ClassificationResult r;
  r.is_suspicious = false;
  r.confidence = Confidence::kLow;
  r.is_delivery = false;
  r.description = "analysis failed";
  r.reason = std::move(reason);
  return r;
}

std::string extract_json_payload(const std::string& reply) {
  if (reply.find("```json") != std::string::npos) return between_fences(reply, "```json");
  if (reply.find("```") != std::string::npos) return between_fences(reply, "```");
  return trim(reply);
}

Result<ClassificationResult> parse_classification(const std::string& reply) {
  const std::string payload = extract_json_payload(reply);

  const json doc = json::parse(payload, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return Result<ClassificationResult>::err(
        Status::parse_error("classifier reply is not JSON: " + payload.substr(0, 120)));
  }
  if (!doc.is_object()) {
    return Result<ClassificationResult>::err(
        Status::parse_error("classifier reply is not a JSON object"));
  }

  ClassificationResult r;
  r.is_suspicious = read_bool(doc, "is_suspicious", false);
  r.is_delivery = read_bool(doc, "is_delivery", false);
  r.confidence = read_confidence(doc);
  r.description = read_string(doc, "description");
  r.reason = read_string(doc, "reason");
  return Result<ClassificationResult>::ok(std::move(r));
}

ClassificationResult parse_classification_or_default(const std::string& reply) {
  auto r = parse_classification(reply);
  if (r.ok()) return r.take_value();

  spdlog::error("Classifier: failed to parse reply as JSON: {}", r.status().message());
  spdlog::debug("Classifier: raw reply: {}", reply);
  return safe_default_result("JSON parse error: " + r.status().message());
}

std::string classification_to_json(const ClassificationResult& r, int indent) {
  const json j = {
      {"is_suspicious", r.is_suspicious},
      {"confidence", confidence_name(r.confidence)},
      {"is_delivery", r.is_delivery},
      {"description", r.description},
      {"reason", r.reason},
  };
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace dw
