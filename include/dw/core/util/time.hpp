// File: include/dw/core/util/time.hpp
#pragma once

#include <string>

#include "dw/core/types.hpp"

namespace dw {

// Monotonic clock, for cooldowns and deadlines.
TimestampNs steady_now_ns();

// Absolute epoch time, for journal lines and filenames.
TimestampNs wall_now_ns();

// Local-time "YYYYmmdd_HHMMSS" for the given epoch ns.
std::string format_compact_local(TimestampNs wall);

}  // namespace dw
