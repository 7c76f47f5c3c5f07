// File: include/dw/core/analysis/classifier.hpp
#pragma once

#include <string>

#include "dw/core/io/frame.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Still image in, structured judgment out. One request, one response.
// Implementations never fail outward: transport and parse errors come back as
// safe_default_result(<why>).
class Classifier {
 public:
  virtual ~Classifier() = default;

  virtual ClassificationResult classify(const Frame& frame) = 0;
};

// {is_suspicious=false, confidence=low, is_delivery=false, description="analysis failed"}.
ClassificationResult safe_default_result(std::string reason);

// Pulls the structured payload out of a model reply. Handles ```json ... ``` fences, bare ```
// fences, and unwrapped text (returned trimmed).
std::string extract_json_payload(const std::string& reply);

// Strict: kParseError on non-JSON or a non-object payload. Missing keys keep defaults, unknown
// keys are ignored. Accepts "confidence" or "confidence_of_suspicion".
Result<ClassificationResult> parse_classification(const std::string& reply);

// Lenient wrapper used by classifiers: any parse failure maps to safe_default_result.
ClassificationResult parse_classification_or_default(const std::string& reply);

// Compact JSON of the result, used as sidecar / upload metadata.
std::string classification_to_json(const ClassificationResult& r, int indent = 2);

}  // namespace dw
