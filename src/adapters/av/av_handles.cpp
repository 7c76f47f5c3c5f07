// File: src/adapters/av/av_handles.cpp
#include "dw/adapters/av/av_handles.hpp"

extern "C" {
#include <libavutil/error.h>
}

namespace dw {

std::string av_error_text(const char* what, int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

}  // namespace dw
