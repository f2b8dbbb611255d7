#pragma once

#include "protocol/envelope.hpp"
#include "protocol/frame.hpp"
#include "protocol/message_type.hpp"
#include "protocol/state_value.hpp"
#include <cstdint>

namespace ghack::protocol {

// Version exchanged in Connect; peers must match exactly
constexpr uint32_t PROTOCOL_VERSION = 1;

// Default port for CLI usage (not game logic)
constexpr uint16_t DEFAULT_PORT = 7777;

} // namespace ghack::protocol
