#pragma once

#include "protocol/errors.hpp"
#include <cstdint>
#include <string>

namespace ghack::protocol {

// Envelope discriminant. Values are fixed by the wire format.
enum class MessageType : uint8_t {
    Connect = 1,
    Disconnect = 2,
    Login = 3,
    LoginResult = 4,
    AddEntity = 5,
    RemoveEntity = 6,
    UpdateState = 7,
    Move = 8,
    AssignControl = 9,
    EntityDeath = 10,
    CombatHit = 11,
};

enum class DisconnectReason : uint8_t {
    Quit = 1,                  // Normal quit
    ProtocolError = 2,         // Peer violated the protocol
    WrongProtocolVersion = 3,  // Incompatible protocol versions
    Kicked = 4,                // Forcibly disconnected by the server
};

enum class LoginReason : uint8_t {
    Accepted = 0,
    AccessDenied = 1,  // Wrong username or token
    ServerFull = 2,
    Banned = 3,
};

inline const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Connect: return "Connect";
        case MessageType::Disconnect: return "Disconnect";
        case MessageType::Login: return "Login";
        case MessageType::LoginResult: return "LoginResult";
        case MessageType::AddEntity: return "AddEntity";
        case MessageType::RemoveEntity: return "RemoveEntity";
        case MessageType::UpdateState: return "UpdateState";
        case MessageType::Move: return "Move";
        case MessageType::AssignControl: return "AssignControl";
        case MessageType::EntityDeath: return "EntityDeath";
        case MessageType::CombatHit: return "CombatHit";
    }
    return "Unknown";
}

inline const char* to_string(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::Quit: return "QUIT";
        case DisconnectReason::ProtocolError: return "PROTOCOL_ERROR";
        case DisconnectReason::WrongProtocolVersion: return "WRONG_PROTOCOL_VERSION";
        case DisconnectReason::Kicked: return "KICKED";
    }
    return "UNKNOWN";
}

inline const char* to_string(LoginReason reason) {
    switch (reason) {
        case LoginReason::Accepted: return "ACCEPTED";
        case LoginReason::AccessDenied: return "ACCESS_DENIED";
        case LoginReason::ServerFull: return "SERVER_FULL";
        case LoginReason::Banned: return "BANNED";
    }
    return "UNKNOWN";
}

// Wire value -> enum, rejecting values outside the defined set

inline MessageType message_type_from_wire(uint64_t raw) {
    if (raw < 1 || raw > 11) {
        throw MalformedPayload("Envelope: unknown message type " + std::to_string(raw));
    }
    return static_cast<MessageType>(raw);
}

inline DisconnectReason disconnect_reason_from_wire(uint64_t raw) {
    if (raw < 1 || raw > 4) {
        throw MalformedPayload("Disconnect: unknown reason " + std::to_string(raw));
    }
    return static_cast<DisconnectReason>(raw);
}

inline LoginReason login_reason_from_wire(uint64_t raw) {
    if (raw > 3) {
        throw MalformedPayload("LoginResult: unknown reason " + std::to_string(raw));
    }
    return static_cast<LoginReason>(raw);
}

} // namespace ghack::protocol
