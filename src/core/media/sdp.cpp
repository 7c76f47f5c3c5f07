// File: src/core/media/sdp.cpp
#include "dw/core/media/sdp.hpp"

#include <sstream>

namespace dw {

Result<SessionId> parse_sdp_session_id(const std::string& sdp) {
  std::istringstream in(sdp);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.rfind("o=", 0) != 0) continue;

    std::istringstream fields(line.substr(2));
    std::string user;
    std::string session_id;
    if (!(fields >> user >> session_id) || session_id.empty()) {
      return Result<SessionId>::err(Status::parse_error("sdp: malformed origin line"));
    }
    return Result<SessionId>::ok(session_id);
  }
  return Result<SessionId>::err(Status::parse_error("sdp: no origin line"));
}

}  // namespace dw
