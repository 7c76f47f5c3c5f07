// File: tests/test_util.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dw/core/media/sdp.hpp"
#include "dw/core/sinks/notifier.hpp"
#include "dw/core/util/base64.hpp"
#include "dw/core/util/time.hpp"

namespace dw {
namespace {

std::vector<std::uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

TEST(Base64, KnownVectors) {
  EXPECT_EQ(base64_encode(bytes("")), "");
  EXPECT_EQ(base64_encode(bytes("f")), "Zg==");
  EXPECT_EQ(base64_encode(bytes("fo")), "Zm8=");
  EXPECT_EQ(base64_encode(bytes("foo")), "Zm9v");
  EXPECT_EQ(base64_encode(bytes("foobar")), "Zm9vYmFy");
  EXPECT_EQ(base64_encode({0xFF, 0xD8, 0xFF}), "/9j/");
}

TEST(Sdp, SessionIdFromOriginLine) {
  auto id = parse_sdp_session_id("v=0\r\no=rtc 4107523824 0 IN IP4 127.0.0.1\r\ns=-\r\n");
  ASSERT_TRUE(id.ok());
  EXPECT_EQ(id.value(), "4107523824");
}

TEST(Sdp, MissingOrMalformedOrigin) {
  EXPECT_EQ(parse_sdp_session_id("v=0\r\ns=-\r\n").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_sdp_session_id("v=0\r\no=rtc\r\n").status().code(), Status::Code::kParseError);
  EXPECT_FALSE(parse_sdp_session_id("").ok());
}

TEST(NotificationText, ThiefAlert) {
  const NotificationMessage m = compose_notification(NotificationKind::kThief, "hooded person");
  EXPECT_EQ(m.subject, "ALERT: Possible Package Thief Detected");
  EXPECT_NE(m.body.find("hooded person"), std::string::npos);
  EXPECT_NE(m.body.find("Check the Ring app or Google Drive for the flagged image."), std::string::npos);
}

TEST(NotificationText, Delivered) {
  const NotificationMessage m = compose_notification(NotificationKind::kDelivered, "courier");
  EXPECT_EQ(m.subject, "Package Delivered");
  EXPECT_NE(m.body.find("courier"), std::string::npos);
  EXPECT_STREQ(notification_kind_name(NotificationKind::kDelivered), "delivered");
}

TEST(Time, CompactLocalFormat) {
  const std::string s = format_compact_local(wall_now_ns());
  ASSERT_EQ(s.size(), 15u);
  EXPECT_EQ(s[8], '_');
}

TEST(Status, CodeNames) {
  EXPECT_STREQ(code_name(Status::Code::kNoResponse), "no_response");
  EXPECT_STREQ(code_name(Status::Code::kRejected), "rejected");
  EXPECT_STREQ(confidence_name(Confidence::kMedium), "medium");
}

}  // namespace
}  // namespace dw
