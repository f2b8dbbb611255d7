#include "server_protocol.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace ghack::server {

using namespace ghack::protocol;

ServerProtocol::ServerProtocol(uint32_t version, std::optional<std::string> version_str,
                               Authenticator& authenticator)
    : ProtocolSession(Role::Server, version, std::move(version_str))
    , authenticator_(authenticator) {
}

void ServerProtocol::handle_handshake(const Envelope& envelope) {
    if (const auto* msg = envelope.get<ConnectMsg>()) {
        on_connect(*msg);
    } else if (const auto* msg = envelope.get<LoginMsg>()) {
        on_login(envelope, *msg);
    }
}

void ServerProtocol::on_connect(const ConnectMsg& msg) {
    record_peer_version(msg);
    if (msg.version != local_version()) {
        std::cout << "[Session] Client protocol version " << msg.version
                  << " does not match " << local_version() << std::endl;
        finish(HandshakeEvent::ConnectRejected, DisconnectReason::WrongProtocolVersion,
               "server speaks protocol version " + std::to_string(local_version()));
        return;
    }

    advance(HandshakeEvent::ConnectAccepted);
    send(connect_message());
}

void ServerProtocol::on_login(const Envelope& envelope, const LoginMsg& msg) {
    LoginVerdict verdict = authenticator_.verify(msg);
    if (!verdict.accepted) {
        std::cout << "[Session] Login for '" << msg.name << "' refused: "
                  << to_string(verdict.reason) << std::endl;
        LoginResultMsg result;
        result.succeeded = false;
        result.reason = verdict.reason;
        send(result);
        finish(HandshakeEvent::LoginRejected, DisconnectReason::Kicked,
               std::string("login failed: ") + to_string(verdict.reason));
        return;
    }

    set_identity(msg.name);
    permissions_ = verdict.permissions;
    advance(HandshakeEvent::LoginAccepted);

    LoginResultMsg result;
    result.succeeded = true;
    send(result);

    std::cout << "[Session] '" << msg.name << "' logged in" << std::endl;
    deliver(envelope);
}

} // namespace ghack::server
