// File: src/adapters/email/smtp_notifier.cpp
#include "dw/adapters/email/smtp_notifier.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "dw/adapters/http/http_client.hpp"

namespace dw {
namespace {

struct PayloadCursor {
  const std::string* text;
  std::size_t offset;
};

size_t read_payload(char* buffer, size_t size, size_t nitems, void* userp) {
  auto* cur = static_cast<PayloadCursor*>(userp);
  const std::size_t room = size * nitems;
  const std::size_t left = cur->text->size() - cur->offset;
  const std::size_t n = std::min(room, left);
  if (n > 0) {
    std::memcpy(buffer, cur->text->data() + cur->offset, n);
    cur->offset += n;
  }
  return n;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

// Message bodies are written with '\n'; SMTP wants CRLF.
std::string to_crlf(const std::string& s) {
  std::string out;
  out.reserve(s.size() + s.size() / 16);
  for (char c : s) {
    if (c == '\n') out += "\r\n";
    else if (c != '\r') out.push_back(c);
  }
  return out;
}

}  // namespace

std::string build_email_payload(const std::string& from,
                                const std::vector<std::string>& to,
                                const NotificationMessage& msg) {
  std::string out;
  out += "From: " + from + "\r\n";
  out += "To: " + join(to, ", ") + "\r\n";
  out += "Subject: " + msg.subject + "\r\n";
  out += "MIME-Version: 1.0\r\n";
  out += "Content-Type: text/plain; charset=UTF-8\r\n";
  out += "\r\n";
  out += to_crlf(msg.body);
  out += "\r\n";
  return out;
}

SmtpNotifier::SmtpNotifier(NotifyConfig cfg) : cfg_(std::move(cfg)) {}

Status SmtpNotifier::notify(NotificationKind kind, const std::string& description) {
  if (!cfg_.configured()) {
    return Status::unavailable("email notifications are not configured");
  }

  const NotificationMessage msg = compose_notification(kind, description);
  const std::string payload = build_email_payload(cfg_.sender_email, cfg_.recipients, msg);
  PayloadCursor cursor{&payload, 0};

  CurlEasy h(curl_easy_init());
  if (!h) return Status::internal("curl_easy_init failed");

  CurlSlist rcpts;
  for (const auto& r : cfg_.recipients) {
    if (!slist_append(rcpts, "<" + r + ">")) return Status::internal("curl_slist_append failed");
  }
  const std::string mail_from = "<" + cfg_.sender_email + ">";

  curl_easy_setopt(h.get(), CURLOPT_URL, cfg_.smtp_url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  curl_easy_setopt(h.get(), CURLOPT_USERNAME, cfg_.sender_email.c_str());
  curl_easy_setopt(h.get(), CURLOPT_PASSWORD, cfg_.app_password.c_str());
  curl_easy_setopt(h.get(), CURLOPT_MAIL_FROM, mail_from.c_str());
  curl_easy_setopt(h.get(), CURLOPT_MAIL_RCPT, rcpts.get());
  curl_easy_setopt(h.get(), CURLOPT_READFUNCTION, &read_payload);
  curl_easy_setopt(h.get(), CURLOPT_READDATA, &cursor);
  curl_easy_setopt(h.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, 30L);
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(h.get());
  if (rc == CURLE_LOGIN_DENIED) {
    return Status::permission_denied(std::string("smtp login denied: ") + curl_easy_strerror(rc));
  }
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    return Status::timeout(std::string("smtp: ") + curl_easy_strerror(rc));
  }
  if (rc != CURLE_OK) {
    return Status::unavailable(std::string("smtp: ") + curl_easy_strerror(rc));
  }

  spdlog::info("SmtpNotifier: sent '{}' ({}) to {} recipient(s)", msg.subject,
               notification_kind_name(kind), cfg_.recipients.size());
  return Status::ok_status();
}

}  // namespace dw
