// File: src/core/util/time.cpp
#include "dw/core/util/time.hpp"

#include <chrono>
#include <ctime>

namespace dw {

TimestampNs steady_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return TimestampNs{std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()};
}

TimestampNs wall_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return TimestampNs{std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()};
}

std::string format_compact_local(TimestampNs wall) {
  const std::time_t secs = static_cast<std::time_t>(wall.ns / 1'000'000'000);
  std::tm tm{};
  localtime_r(&secs, &tm);

  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf, n);
}

}  // namespace dw
