#pragma once

#include "protocol/message_type.hpp"
#include <cstdint>
#include <optional>

namespace ghack {

enum class Role : uint8_t {
    Client,
    Server,
};

// Connection phases. Servers start in AwaitingConnect, clients (which open
// with Connect) in AwaitingConnectAck.
enum class HandshakePhase : uint8_t {
    AwaitingConnect,
    AwaitingConnectAck,
    AwaitingLogin,
    AwaitingLoginResult,
    Established,
    Closed,
};

enum class HandshakeEvent : uint8_t {
    ConnectAccepted,  // Connect with a matching version handled
    ConnectRejected,  // Version mismatch
    LoginSent,        // Client only
    LoginAccepted,
    LoginRejected,
    Disconnected,     // Disconnect sent or received, or the transport failed
};

const char* to_string(Role role);
const char* to_string(HandshakePhase phase);
const char* to_string(HandshakeEvent event);

HandshakePhase initial_phase(Role role);

// Transition function. nullopt means the event is illegal in that phase.
std::optional<HandshakePhase> next_phase(Role role, HandshakePhase phase, HandshakeEvent event);

// Whether a message of this type may be received in this phase. Anything
// else is a protocol error.
bool accepts_inbound(Role role, HandshakePhase phase, protocol::MessageType type);

class Handshake {
public:
    explicit Handshake(Role role);

    Role role() const { return role_; }
    HandshakePhase phase() const { return phase_; }
    bool is_established() const { return phase_ == HandshakePhase::Established; }
    bool is_closed() const { return phase_ == HandshakePhase::Closed; }

    bool accepts(protocol::MessageType type) const { return accepts_inbound(role_, phase_, type); }

    // Applies the event; returns false and leaves the phase untouched when
    // the transition is illegal
    bool advance(HandshakeEvent event);

private:
    Role role_;
    HandshakePhase phase_;
};

} // namespace ghack
