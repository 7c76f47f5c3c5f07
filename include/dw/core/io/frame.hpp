// File: include/dw/core/io/frame.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "dw/core/types.hpp"

namespace dw {

// One captured still. Value type: the pipeline owns it once PullFrame returns.
struct Frame {
  TimestampNs captured_at;            // wall epoch ns
  std::vector<std::uint8_t> jpeg;     // encoded still image bytes

  [[nodiscard]] bool empty() const noexcept { return jpeg.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return jpeg.size(); }
};

}  // namespace dw
