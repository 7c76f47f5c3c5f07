// File: src/core/status.cpp
#include "dw/core/status.hpp"

#include "dw/core/types.hpp"

namespace dw {

const char* code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "ok";
    case Status::Code::kInvalidArgument: return "invalid_argument";
    case Status::Code::kOutOfRange: return "out_of_range";
    case Status::Code::kNotFound: return "not_found";
    case Status::Code::kIoError: return "io_error";
    case Status::Code::kPermissionDenied: return "permission_denied";
    case Status::Code::kUnavailable: return "unavailable";
    case Status::Code::kParseError: return "parse_error";
    case Status::Code::kCorruptData: return "corrupt_data";
    case Status::Code::kTimeout: return "timeout";
    case Status::Code::kRejected: return "rejected";
    case Status::Code::kNoResponse: return "no_response";
    case Status::Code::kUnsupported: return "unsupported";
    case Status::Code::kInternal: return "internal";
  }
  return "unknown";
}

const char* confidence_name(Confidence c) noexcept {
  switch (c) {
    case Confidence::kHigh: return "high";
    case Confidence::kMedium: return "medium";
    case Confidence::kLow: return "low";
  }
  return "low";
}

}  // namespace dw
