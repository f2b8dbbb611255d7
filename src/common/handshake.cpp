#include "handshake.hpp"
#include "protocol/message_type.hpp"
#include <optional>

namespace ghack {

using protocol::MessageType;

const char* to_string(Role role) {
    return role == Role::Server ? "server" : "client";
}

const char* to_string(HandshakePhase phase) {
    switch (phase) {
        case HandshakePhase::AwaitingConnect: return "AwaitingConnect";
        case HandshakePhase::AwaitingConnectAck: return "AwaitingConnectAck";
        case HandshakePhase::AwaitingLogin: return "AwaitingLogin";
        case HandshakePhase::AwaitingLoginResult: return "AwaitingLoginResult";
        case HandshakePhase::Established: return "Established";
        case HandshakePhase::Closed: return "Closed";
    }
    return "Unknown";
}

const char* to_string(HandshakeEvent event) {
    switch (event) {
        case HandshakeEvent::ConnectAccepted: return "ConnectAccepted";
        case HandshakeEvent::ConnectRejected: return "ConnectRejected";
        case HandshakeEvent::LoginSent: return "LoginSent";
        case HandshakeEvent::LoginAccepted: return "LoginAccepted";
        case HandshakeEvent::LoginRejected: return "LoginRejected";
        case HandshakeEvent::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

HandshakePhase initial_phase(Role role) {
    return role == Role::Server ? HandshakePhase::AwaitingConnect : HandshakePhase::AwaitingConnectAck;
}

std::optional<HandshakePhase> next_phase(Role role, HandshakePhase phase, HandshakeEvent event) {
    if (phase == HandshakePhase::Closed) {
        return std::nullopt;
    }
    if (event == HandshakeEvent::Disconnected) {
        return HandshakePhase::Closed;
    }

    const bool server = role == Role::Server;
    switch (phase) {
        case HandshakePhase::AwaitingConnect:
            if (!server) break;
            if (event == HandshakeEvent::ConnectAccepted) return HandshakePhase::AwaitingLogin;
            if (event == HandshakeEvent::ConnectRejected) return HandshakePhase::Closed;
            break;

        case HandshakePhase::AwaitingConnectAck:
            if (server) break;
            if (event == HandshakeEvent::ConnectAccepted) return HandshakePhase::AwaitingLogin;
            if (event == HandshakeEvent::ConnectRejected) return HandshakePhase::Closed;
            break;

        case HandshakePhase::AwaitingLogin:
            // The server verifies credentials synchronously and answers at once,
            // so only the client waits in AwaitingLoginResult
            if (server) {
                if (event == HandshakeEvent::LoginAccepted) return HandshakePhase::Established;
                if (event == HandshakeEvent::LoginRejected) return HandshakePhase::Closed;
            } else if (event == HandshakeEvent::LoginSent) {
                return HandshakePhase::AwaitingLoginResult;
            }
            break;

        case HandshakePhase::AwaitingLoginResult:
            if (server) break;
            if (event == HandshakeEvent::LoginAccepted) return HandshakePhase::Established;
            if (event == HandshakeEvent::LoginRejected) return HandshakePhase::Closed;
            break;

        case HandshakePhase::Established:
        case HandshakePhase::Closed:
            break;
    }
    return std::nullopt;
}

bool accepts_inbound(Role role, HandshakePhase phase, MessageType type) {
    if (phase == HandshakePhase::Closed) {
        return false;
    }
    if (type == MessageType::Disconnect) {
        return true;
    }

    const bool server = role == Role::Server;
    switch (phase) {
        case HandshakePhase::AwaitingConnect:
            return server && type == MessageType::Connect;
        case HandshakePhase::AwaitingConnectAck:
            return !server && type == MessageType::Connect;
        case HandshakePhase::AwaitingLogin:
            return server && type == MessageType::Login;
        case HandshakePhase::AwaitingLoginResult:
            return !server && type == MessageType::LoginResult;
        case HandshakePhase::Established:
            switch (type) {
                case MessageType::AddEntity:
                case MessageType::RemoveEntity:
                case MessageType::UpdateState:
                case MessageType::EntityDeath:
                case MessageType::CombatHit:
                    return true;
                case MessageType::Move:
                    return server;
                case MessageType::AssignControl:
                    return !server;
                default:
                    return false;
            }
        case HandshakePhase::Closed:
            return false;
    }
    return false;
}

Handshake::Handshake(Role role)
    : role_(role)
    , phase_(initial_phase(role)) {
}

bool Handshake::advance(HandshakeEvent event) {
    auto next = next_phase(role_, phase_, event);
    if (!next) {
        return false;
    }
    phase_ = *next;
    return true;
}

} // namespace ghack
