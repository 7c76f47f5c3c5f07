// File: tests/test_cloud_sinks.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "dw/adapters/drive/drive_uploader.hpp"
#include "dw/adapters/email/smtp_notifier.hpp"
#include "dw/adapters/openai/openai_classifier.hpp"
#include "dw/adapters/webhook/webhook_forwarder.hpp"
#include "dw/core/util/time.hpp"
#include "test_fakes.hpp"

namespace dw {
namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

// -----------------------------
// Classifier payloads
// -----------------------------

TEST(OpenAiPayloads, RequestCarriesImageThenPrompt) {
  ClassifierConfig cfg;
  Frame frame;
  frame.jpeg = {0xFF, 0xD8, 0xFF};

  const json body = json::parse(build_analysis_request(cfg, frame));
  EXPECT_EQ(body["model"], "gpt-4o");
  EXPECT_EQ(body["max_tokens"], 1024);
  ASSERT_EQ(body["messages"].size(), 1u);
  const json& content = body["messages"][0]["content"];
  ASSERT_EQ(content.size(), 2u);
  EXPECT_EQ(content[0]["type"], "image_url");
  EXPECT_EQ(content[0]["image_url"]["url"], "data:image/jpeg;base64,/9j/");
  EXPECT_EQ(content[1]["type"], "text");
  EXPECT_NE(content[1]["text"].get<std::string>().find("is_suspicious"), std::string::npos);
}

TEST(OpenAiPayloads, ExtractReplyText) {
  auto text = extract_reply_text(R"({"choices": [{"message": {"role": "assistant", "content": "{}"}}]})");
  ASSERT_TRUE(text.ok());
  EXPECT_EQ(text.value(), "{}");

  EXPECT_FALSE(extract_reply_text(R"({"choices": []})").ok());
  EXPECT_FALSE(extract_reply_text(R"({"error": {"message": "quota"}})").ok());
  EXPECT_FALSE(extract_reply_text(R"({"choices": [{"message": {"content": null}}]})").ok());
  EXPECT_FALSE(extract_reply_text("oops").ok());
}

TEST(OpenAiClassifier, UnreachableEndpointGivesSafeDefault) {
  ClassifierConfig cfg;
  cfg.api_key = "sk-test";
  cfg.endpoint = "http://127.0.0.1:9/v1/chat/completions";
  cfg.request_timeout_s = 2.0;
  OpenAiClassifier classifier(cfg, std::make_shared<HttpClient>("doorwatch-test"));

  Frame frame;
  frame.jpeg = {1, 2, 3};
  const ClassificationResult r = classifier.classify(frame);
  EXPECT_FALSE(r.is_suspicious);
  EXPECT_FALSE(r.is_delivery);
  EXPECT_EQ(r.description, "analysis failed");
  EXPECT_FALSE(r.reason.empty());
}

// -----------------------------
// Drive
// -----------------------------

TEST(DrivePayloads, TokenFromEitherKey) {
  EXPECT_EQ(parse_drive_token(R"({"token": "a"})").value(), "a");
  EXPECT_EQ(parse_drive_token(R"({"access_token": "b"})").value(), "b");
  EXPECT_FALSE(parse_drive_token(R"({"refresh_token": "c"})").ok());
  EXPECT_FALSE(parse_drive_token("nope").ok());
}

TEST(DrivePayloads, MultipartHasMetadataThenImage) {
  const std::string body =
      build_drive_multipart("BOUND", "folder-1", "ring_x.jpg", "{\"k\":1}", {0xFF, 0xD8});

  const auto meta_start = body.find("\r\n\r\n") + 4;
  const auto meta_end = body.find("\r\n--BOUND\r\n");
  ASSERT_NE(meta_end, std::string::npos);
  const json meta = json::parse(body.substr(meta_start, meta_end - meta_start));
  EXPECT_EQ(meta["name"], "ring_x.jpg");
  EXPECT_EQ(meta["description"], "{\"k\":1}");
  EXPECT_EQ(meta["parents"][0], "folder-1");

  EXPECT_EQ(body.rfind("--BOUND\r\n", 0), 0u);
  EXPECT_NE(body.find("Content-Type: image/jpeg\r\n\r\n\xFF\xD8"), std::string::npos);
  EXPECT_EQ(body.substr(body.size() - 11), "--BOUND--\r\n");
}

TEST(DrivePayloads, FileId) {
  EXPECT_EQ(parse_drive_file_id(R"({"id": "abc", "webViewLink": "x"})").value(), "abc");
  EXPECT_FALSE(parse_drive_file_id("{}").ok());
}

TEST(DriveUploader, MissingTokenFileFailsBeforeUpload) {
  StorageConfig cfg;
  cfg.drive_folder_id = "folder";
  cfg.drive_token_file = (fs::temp_directory_path() / "dw_missing_token.json").string();
  DriveUploader uploader(cfg, std::make_shared<HttpClient>("doorwatch-test"));

  EXPECT_EQ(uploader.upload({1, 2}, "a.jpg", "{}").status().code(), Status::Code::kNotFound);
  EXPECT_EQ(uploader.upload({}, "a.jpg", "{}").status().code(), Status::Code::kInvalidArgument);
}

// -----------------------------
// Email
// -----------------------------

TEST(EmailPayload, HeadersAndCrlfBody) {
  NotificationMessage msg{"Package Delivered", "line one\nline two"};
  const std::string p = build_email_payload("me@example.com", {"a@example.com", "b@example.com"}, msg);

  EXPECT_EQ(p.rfind("From: me@example.com\r\n", 0), 0u);
  EXPECT_NE(p.find("To: a@example.com, b@example.com\r\n"), std::string::npos);
  EXPECT_NE(p.find("Subject: Package Delivered\r\n"), std::string::npos);
  EXPECT_NE(p.find("\r\n\r\nline one\r\nline two\r\n"), std::string::npos);
}

TEST(SmtpNotifier, UnconfiguredIsUnavailable) {
  SmtpNotifier notifier(NotifyConfig{});
  EXPECT_EQ(notifier.notify(NotificationKind::kThief, "x").code(), Status::Code::kUnavailable);
}

// -----------------------------
// Webhook
// -----------------------------

TEST(WebhookPayload, CarriesDeviceTimestampAndImage) {
  Frame frame;
  frame.captured_at = TimestampNs{1'700'000'000'000'000'000};
  frame.jpeg = {0xFF, 0xD8, 0xFF};

  const json body = json::parse(build_webhook_payload(Device{"111", "Front Door", true}, frame));
  EXPECT_EQ(body["doorbell_name"], "Front Door");
  EXPECT_EQ(body["doorbell_id"], "111");
  EXPECT_EQ(body["image_base64"], "/9j/");
  const std::string ts = body["timestamp"].get<std::string>();
  ASSERT_EQ(ts.size(), 15u);  // YYYYmmdd_HHMMSS
  EXPECT_EQ(ts[8], '_');
  EXPECT_EQ(ts, format_compact_local(frame.captured_at));
}

TEST(WebhookForwarder, UnreachableOrUnsetIsReported) {
  Frame frame;
  frame.jpeg = {1, 2, 3};
  const Device device{"111", "Front Door", true};

  WebhookForwarder unset(NotifyConfig{}, std::make_shared<HttpClient>("doorwatch-test"));
  EXPECT_EQ(unset.forward(device, frame).code(), Status::Code::kUnavailable);

  NotifyConfig cfg;
  cfg.webhook_url = "http://127.0.0.1:9/webhook/ring-motion";
  cfg.webhook_timeout_s = 2.0;
  WebhookForwarder forwarder(cfg, std::make_shared<HttpClient>("doorwatch-test"));
  EXPECT_EQ(forwarder.forward(device, Frame{}).code(), Status::Code::kInvalidArgument);
  EXPECT_FALSE(forwarder.forward(device, frame).ok());
}

}  // namespace
}  // namespace dw
