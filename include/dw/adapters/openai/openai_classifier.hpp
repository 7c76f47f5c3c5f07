// File: include/dw/adapters/openai/openai_classifier.hpp
#pragma once

#include <memory>
#include <string>

#include "dw/adapters/http/http_client.hpp"
#include "dw/core/analysis/classifier.hpp"
#include "dw/core/config.hpp"

namespace dw {

// Package-theft / delivery prompt sent with every frame.
extern const char* const kAnalysisPrompt;

// Chat-completions request body: one user message carrying the image as a base64 data URL
// followed by the analysis prompt.
std::string build_analysis_request(const ClassifierConfig& cfg, const Frame& frame);

// choices[0].message.content, or kParseError.
Result<std::string> extract_reply_text(const std::string& response_body);

// Classifier over an OpenAI-compatible chat-completions endpoint. Never throws; every failure
// comes back as safe_default_result(<why>).
class OpenAiClassifier final : public Classifier {
 public:
  OpenAiClassifier(ClassifierConfig cfg, std::shared_ptr<HttpClient> http);

  ClassificationResult classify(const Frame& frame) override;

 private:
  ClassifierConfig cfg_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace dw
