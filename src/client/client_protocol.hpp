#pragma once

#include "common/protocol_session.hpp"
#include "protocol/protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ghack::client {

struct Credentials {
    std::string name;
    std::optional<std::string> authtoken;
    std::optional<uint32_t> permissions;
};

// Client half of the handshake: opens with Connect, logs in once the server
// answered with a matching version, then carries game traffic
class ClientProtocol : public ProtocolSession {
public:
    ClientProtocol(uint32_t version, std::optional<std::string> version_str, Credentials credentials);

    // Sends the opening Connect
    void start();

    // Suggest a movement direction for the controlled entity. Refused until
    // the server has granted control of something.
    bool move(const protocol::Vector3& direction);

    // Polite goodbye
    void quit(const std::string& reason_str = {});

    // Some entity under our control, if any
    std::optional<int32_t> controlled_entity() const;

    const Credentials& credentials() const { return credentials_; }
    // Reason from a refused LoginResult
    std::optional<protocol::LoginReason> login_failure() const { return login_failure_; }

protected:
    void handle_handshake(const protocol::Envelope& envelope) override;

private:
    void on_connect(const protocol::ConnectMsg& msg);
    void on_login_result(const protocol::Envelope& envelope, const protocol::LoginResultMsg& msg);

    Credentials credentials_;
    bool started_ = false;
    std::optional<protocol::LoginReason> login_failure_;
};

} // namespace ghack::client
