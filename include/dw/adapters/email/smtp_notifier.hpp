// File: include/dw/adapters/email/smtp_notifier.hpp
#pragma once

#include <string>
#include <vector>

#include "dw/core/config.hpp"
#include "dw/core/sinks/notifier.hpp"

namespace dw {

// RFC 5322 message text (CRLF line endings) for one notification.
std::string build_email_payload(const std::string& from,
                                const std::vector<std::string>& to,
                                const NotificationMessage& msg);

// Plain-text email over SMTP with STARTTLS (libcurl). One message per call, addressed to every
// configured recipient.
class SmtpNotifier final : public Notifier {
 public:
  explicit SmtpNotifier(NotifyConfig cfg);

  Status notify(NotificationKind kind, const std::string& description) override;

 private:
  NotifyConfig cfg_;
};

}  // namespace dw
