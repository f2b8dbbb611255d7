#include "protocol_session.hpp"
#include "protocol/protocol.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace ghack {

using namespace ghack::protocol;

namespace {

bool is_handshake_traffic(MessageType type) {
    return type == MessageType::Connect || type == MessageType::Disconnect ||
           type == MessageType::Login || type == MessageType::LoginResult;
}

} // namespace

ProtocolSession::ProtocolSession(Role role, uint32_t version, std::optional<std::string> version_str)
    : handshake_(role)
    , local_version_(version)
    , local_version_str_(std::move(version_str)) {
}

void ProtocolSession::receive(const Envelope& envelope) {
    const MessageType type = envelope.type();
    if (is_closed()) {
        std::cout << "[Session] Ignoring " << to_string(type) << " after close" << std::endl;
        return;
    }

    if (!handshake_.accepts(type)) {
        protocol_error(std::string("unexpected ") + to_string(type) + " while " + to_string(phase()));
        return;
    }

    if (const auto* msg = envelope.get<DisconnectMsg>()) {
        std::cout << "[Session] Peer disconnected: " << to_string(msg->reason);
        if (msg->reason_str) {
            std::cout << " (" << *msg->reason_str << ")";
        }
        std::cout << std::endl;
        deliver(envelope);
        terminate(HandshakeEvent::Disconnected, msg->reason);
        return;
    }

    if (!is_established()) {
        handle_handshake(envelope);
        return;
    }

    handle_traffic(envelope);
}

void ProtocolSession::handle_traffic(const Envelope& envelope) {
    if (const auto* msg = envelope.get<AddEntityMsg>()) {
        if (entities_.add(msg->id, msg->name) == SyncResult::Redundant) {
            std::cout << "[Session] Entity " << msg->id << " announced again" << std::endl;
        }
    } else if (const auto* msg = envelope.get<RemoveEntityMsg>()) {
        if (entities_.remove(msg->id) == SyncResult::UnknownEntity) {
            minor_error("RemoveEntity for unknown entity " + std::to_string(msg->id));
            return;
        }
    } else if (const auto* msg = envelope.get<UpdateStateMsg>()) {
        if (entities_.update(msg->id, msg->state_id, msg->value) == SyncResult::UnknownEntity) {
            minor_error("UpdateState '" + msg->state_id + "' for unknown entity " + std::to_string(msg->id));
            return;
        }
    } else if (const auto* msg = envelope.get<AssignControlMsg>()) {
        if (msg->is_revoked()) {
            controlled_.erase(msg->uid);
        } else {
            controlled_.insert(msg->uid);
        }
    } else if (envelope.is<MoveMsg>()) {
        if (controlled_.empty()) {
            minor_error("Move without a controlled entity");
            return;
        }
    }
    deliver(envelope);
}

bool ProtocolSession::send(const Envelope& envelope) {
    const MessageType type = envelope.type();
    if (is_closed()) {
        std::cerr << "[Session] Cannot send " << to_string(type) << " on a closed session" << std::endl;
        return false;
    }

    if (const auto* msg = envelope.get<DisconnectMsg>()) {
        finish(HandshakeEvent::Disconnected, msg->reason, msg->reason_str.value_or(""));
        return true;
    }

    if (!is_handshake_traffic(type) && !is_established()) {
        std::cerr << "[Session] Cannot send " << to_string(type) << " while " << to_string(phase()) << std::endl;
        return false;
    }

    // The peer would answer with PROTOCOL_ERROR
    if (!is_handshake_traffic(type) && !accepts_inbound(peer_role(), HandshakePhase::Established, type)) {
        std::cerr << "[Session] A " << to_string(role()) << " cannot send " << to_string(type) << std::endl;
        return false;
    }

    const size_t size = envelope.serialize().size();
    if (size > MAX_FRAME_PAYLOAD) {
        std::cerr << "[Session] Outbound " << to_string(type) << " is " << size
                  << " bytes, over the frame limit" << std::endl;
        finish(HandshakeEvent::Disconnected, DisconnectReason::ProtocolError, "outbound message too large");
        return false;
    }

    track_outbound(envelope);
    write(envelope);
    return true;
}

void ProtocolSession::track_outbound(const Envelope& envelope) {
    if (const auto* msg = envelope.get<AddEntityMsg>()) {
        announced_.insert(msg->id);
    } else if (const auto* msg = envelope.get<RemoveEntityMsg>()) {
        if (announced_.erase(msg->id) == 0) {
            std::cerr << "[Session] Sending RemoveEntity for unannounced entity " << msg->id << std::endl;
        }
    } else if (const auto* msg = envelope.get<UpdateStateMsg>()) {
        if (announced_.count(msg->id) == 0) {
            std::cerr << "[Session] Sending UpdateState for unannounced entity " << msg->id << std::endl;
        }
    } else if (const auto* msg = envelope.get<AssignControlMsg>()) {
        if (role() != Role::Server) {
            return;
        }
        if (msg->is_revoked()) {
            controlled_.erase(msg->uid);
        } else {
            controlled_.insert(msg->uid);
        }
    }
}

void ProtocolSession::write(const Envelope& envelope) {
    if (send_callback_) {
        send_callback_(envelope);
    }
}

void ProtocolSession::disconnect(DisconnectReason reason, const std::string& reason_str) {
    if (is_closed()) {
        return;
    }
    finish(HandshakeEvent::Disconnected, reason, reason_str);
}

void ProtocolSession::close(DisconnectReason reason) {
    if (is_closed()) {
        return;
    }
    terminate(HandshakeEvent::Disconnected, reason);
}

void ProtocolSession::finish(HandshakeEvent event, DisconnectReason reason, const std::string& reason_str) {
    DisconnectMsg msg;
    msg.reason = reason;
    if (!reason_str.empty()) {
        msg.reason_str = reason_str;
    }
    write(msg);
    terminate(event, reason);
}

void ProtocolSession::terminate(HandshakeEvent event, DisconnectReason reason) {
    if (!handshake_.advance(event)) {
        handshake_.advance(HandshakeEvent::Disconnected);
    }
    close_reason_ = reason;
    if (close_callback_) {
        close_callback_(reason);
    }
}

void ProtocolSession::advance(HandshakeEvent event) {
    HandshakePhase from = phase();
    if (!handshake_.advance(event)) {
        std::cerr << "[Session] Illegal handshake event " << to_string(event)
                  << " while " << to_string(from) << std::endl;
    }
}

void ProtocolSession::deliver(const Envelope& envelope) {
    if (message_callback_) {
        message_callback_(envelope);
    }
}

void ProtocolSession::protocol_error(const std::string& what) {
    std::cerr << "[Session] Protocol error: " << what << std::endl;
    finish(HandshakeEvent::Disconnected, DisconnectReason::ProtocolError, what);
}

void ProtocolSession::minor_error(const std::string& what) {
    ++minor_errors_;
    std::cout << "[Session] Minor error (ignored): " << what << std::endl;
}

void ProtocolSession::record_peer_version(const ConnectMsg& msg) {
    peer_version_ = msg.version;
    peer_version_str_ = msg.version_str;
}

ConnectMsg ProtocolSession::connect_message() const {
    ConnectMsg msg;
    msg.version = local_version_;
    msg.version_str = local_version_str_;
    return msg;
}

} // namespace ghack
