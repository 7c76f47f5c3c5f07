// File: src/core/sinks/notification_text.cpp
#include "dw/core/sinks/notifier.hpp"

namespace dw {

const char* notification_kind_name(NotificationKind kind) noexcept {
  switch (kind) {
    case NotificationKind::kDelivered: return "delivered";
    case NotificationKind::kThief: return "thief";
  }
  return "unknown";
}

NotificationMessage compose_notification(NotificationKind kind, const std::string& description) {
  NotificationMessage m;
  switch (kind) {
    case NotificationKind::kDelivered:
      m.subject = "Package Delivered";
      m.body = "A package delivery was detected at the front door.\n\n" + description;
      break;
    case NotificationKind::kThief:
      m.subject = "ALERT: Possible Package Thief Detected";
      m.body = "Suspicious activity was detected at the front door.\n\n" + description +
               "\n\nCheck the Ring app or Google Drive for the flagged image.";
      break;
  }
  return m;
}

}  // namespace dw
