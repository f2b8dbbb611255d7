#pragma once

#include "common/protocol_session.hpp"
#include "server/authenticator.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ghack::server {

// Server half of the handshake: validates the client's Connect, answers with
// our own Connect, then asks the authenticator about the Login
class ServerProtocol : public ProtocolSession {
public:
    ServerProtocol(uint32_t version, std::optional<std::string> version_str, Authenticator& authenticator);

    // Permission bits granted at login
    uint32_t permissions() const { return permissions_; }

protected:
    void handle_handshake(const protocol::Envelope& envelope) override;

private:
    void on_connect(const protocol::ConnectMsg& msg);
    void on_login(const protocol::Envelope& envelope, const protocol::LoginMsg& msg);

    Authenticator& authenticator_;
    uint32_t permissions_ = 0;
};

} // namespace ghack::server
