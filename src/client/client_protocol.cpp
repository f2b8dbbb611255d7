#include "client_protocol.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace ghack::client {

using namespace ghack::protocol;

ClientProtocol::ClientProtocol(uint32_t version, std::optional<std::string> version_str, Credentials credentials)
    : ProtocolSession(Role::Client, version, std::move(version_str))
    , credentials_(std::move(credentials)) {
}

void ClientProtocol::start() {
    if (started_) {
        return;
    }
    started_ = true;
    send(connect_message());
}

bool ClientProtocol::move(const Vector3& direction) {
    if (!is_established()) {
        std::cerr << "[Client] Cannot move before login completed" << std::endl;
        return false;
    }
    if (controlled().empty()) {
        std::cerr << "[Client] Cannot move without a controlled entity" << std::endl;
        return false;
    }
    MoveMsg msg;
    msg.direction = direction;
    return send(msg);
}

void ClientProtocol::quit(const std::string& reason_str) {
    disconnect(DisconnectReason::Quit, reason_str);
}

std::optional<int32_t> ClientProtocol::controlled_entity() const {
    if (controlled().empty()) {
        return std::nullopt;
    }
    return *controlled().begin();
}

void ClientProtocol::handle_handshake(const Envelope& envelope) {
    if (const auto* msg = envelope.get<ConnectMsg>()) {
        on_connect(*msg);
    } else if (const auto* msg = envelope.get<LoginResultMsg>()) {
        on_login_result(envelope, *msg);
    }
}

void ClientProtocol::on_connect(const ConnectMsg& msg) {
    record_peer_version(msg);
    if (msg.version != local_version()) {
        std::cout << "[Client] Server protocol version " << msg.version
                  << " does not match " << local_version() << std::endl;
        finish(HandshakeEvent::ConnectRejected, DisconnectReason::WrongProtocolVersion,
               "client speaks protocol version " + std::to_string(local_version()));
        return;
    }

    advance(HandshakeEvent::ConnectAccepted);

    LoginMsg login;
    login.name = credentials_.name;
    login.authtoken = credentials_.authtoken;
    login.permissions = credentials_.permissions;
    advance(HandshakeEvent::LoginSent);
    send(login);
}

void ClientProtocol::on_login_result(const Envelope& envelope, const LoginResultMsg& msg) {
    if (msg.succeeded) {
        set_identity(credentials_.name);
        advance(HandshakeEvent::LoginAccepted);
        std::cout << "[Client] Logged in as '" << credentials_.name << "'" << std::endl;
        deliver(envelope);
        return;
    }

    login_failure_ = msg.reason.value_or(LoginReason::AccessDenied);
    std::cout << "[Client] Login refused: " << to_string(*login_failure_) << std::endl;
    deliver(envelope);
    terminate(HandshakeEvent::LoginRejected, DisconnectReason::Kicked);
}

} // namespace ghack::client
