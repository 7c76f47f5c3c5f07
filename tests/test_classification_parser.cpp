// File: tests/test_classification_parser.cpp
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "dw/core/analysis/classifier.hpp"

namespace dw {
namespace {

TEST(ClassificationParser, FencedJsonBlock) {
  const std::string reply =
      "Here is my analysis:\n```json\n{\"is_suspicious\": true, \"confidence_of_suspicion\": \"high\","
      " \"is_delivery\": false, \"description\": \"person grabs box\", \"reason\": \"leaves fast\"}\n```\nDone.";
  auto r = parse_classification(reply);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_TRUE(r->is_suspicious);
  EXPECT_EQ(r->confidence, Confidence::kHigh);
  EXPECT_FALSE(r->is_delivery);
  EXPECT_EQ(r->description, "person grabs box");
  EXPECT_EQ(r->reason, "leaves fast");
}

TEST(ClassificationParser, BareFence) {
  auto r = parse_classification("```\n{\"is_delivery\": true, \"confidence\": \"Medium\"}\n```");
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r->is_delivery);
  EXPECT_EQ(r->confidence, Confidence::kMedium);
}

TEST(ClassificationParser, UnwrappedJsonWithWhitespace) {
  auto r = parse_classification("  \n{\"is_suspicious\": false, \"description\": \"cat\"}\n ");
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r->is_suspicious);
  EXPECT_EQ(r->description, "cat");
}

TEST(ClassificationParser, MissingKeysKeepDefaults) {
  auto r = parse_classification("{}");
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r->is_suspicious);
  EXPECT_FALSE(r->is_delivery);
  EXPECT_EQ(r->confidence, Confidence::kLow);
  EXPECT_TRUE(r->description.empty());
}

TEST(ClassificationParser, QuotedBooleansAreAccepted) {
  auto r = parse_classification("{\"is_suspicious\": \"true\", \"is_delivery\": \"no\"}");
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r->is_suspicious);
  EXPECT_FALSE(r->is_delivery);
}

TEST(ClassificationParser, UnknownKeysAreIgnored) {
  auto r = parse_classification("{\"is_suspicious\": true, \"weather\": \"rain\"}");
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r->is_suspicious);
}

TEST(ClassificationParser, GarbageIsParseError) {
  auto r = parse_classification("I cannot help with that.");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST(ClassificationParser, NonObjectIsParseError) {
  auto r = parse_classification("[1, 2, 3]");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST(ClassificationParser, LenientWrapperFallsBackToSafeDefault) {
  const ClassificationResult r = parse_classification_or_default("not json at all");
  EXPECT_FALSE(r.is_suspicious);
  EXPECT_FALSE(r.is_delivery);
  EXPECT_EQ(r.confidence, Confidence::kLow);
  EXPECT_EQ(r.description, "analysis failed");
  EXPECT_NE(r.reason.find("JSON parse error"), std::string::npos);
}

TEST(ClassificationParser, ExtractPayloadPrefersJsonFence) {
  EXPECT_EQ(extract_json_payload("x ```json\n{\"a\":1}\n``` y"), "{\"a\":1}");
  EXPECT_EQ(extract_json_payload("```\n{\"b\":2}```"), "{\"b\":2}");
  EXPECT_EQ(extract_json_payload("  {\"c\":3}  "), "{\"c\":3}");
  // Unterminated fence takes the rest.
  EXPECT_EQ(extract_json_payload("```json\n{\"d\":4}"), "{\"d\":4}");
}

TEST(ClassificationParser, ToJsonRoundTripsFields) {
  ClassificationResult r;
  r.is_suspicious = true;
  r.confidence = Confidence::kMedium;
  r.description = "someone";
  r.reason = "because";

  const auto j = nlohmann::json::parse(classification_to_json(r));
  EXPECT_EQ(j["is_suspicious"], true);
  EXPECT_EQ(j["confidence"], "medium");
  EXPECT_EQ(j["is_delivery"], false);
  EXPECT_EQ(j["description"], "someone");
  EXPECT_EQ(j["reason"], "because");
  EXPECT_EQ(classification_to_json(r, -1).find('\n'), std::string::npos);
}

}  // namespace
}  // namespace dw
