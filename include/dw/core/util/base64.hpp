// File: include/dw/core/util/base64.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dw {

// Standard alphabet, '=' padded, no line breaks.
std::string base64_encode(const std::vector<std::uint8_t>& bytes);

}  // namespace dw
