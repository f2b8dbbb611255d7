#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ghack {

// Whole-string decimal port in [1, 65535]; anything else is nullopt
std::optional<uint16_t> parse_port(const std::string& text);

} // namespace ghack
