// File: include/dw/core/media/sdp.hpp
#pragma once

#include <string>

#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Session id from the origin line ("o=<user> <sess-id> <version> IN IP4 <addr>").
// kParseError when there is no origin line or it has no session id field.
Result<SessionId> parse_sdp_session_id(const std::string& sdp);

}  // namespace dw
