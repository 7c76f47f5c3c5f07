// File: include/dw/core/sinks/notifier.hpp
#pragma once

#include <string>

#include "dw/core/status.hpp"

namespace dw {

enum class NotificationKind {
  kDelivered,
  kThief,
};

const char* notification_kind_name(NotificationKind kind) noexcept;

struct NotificationMessage {
  std::string subject;
  std::string body;
};

NotificationMessage compose_notification(NotificationKind kind, const std::string& description);

// Best-effort outbound notification (email today).
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual Status notify(NotificationKind kind, const std::string& description) = 0;
};

}  // namespace dw
