#pragma once

#include "common/entity_table.hpp"
#include "common/handshake.hpp"
#include "protocol/protocol.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace ghack {

// Per-connection protocol state: handshake phase, negotiated version,
// authenticated identity and the entities the peer has announced.
// Transport independent; bytes go out through the send callback and decoded
// envelopes come in through receive(). Not thread safe; a connection drives
// it from one strand.
class ProtocolSession {
public:
    using SendCallback = std::function<void(const protocol::Envelope&)>;
    using MessageCallback = std::function<void(const protocol::Envelope&)>;
    using CloseCallback = std::function<void(protocol::DisconnectReason)>;

    virtual ~ProtocolSession() = default;

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    void set_send_callback(SendCallback callback) { send_callback_ = std::move(callback); }
    // Game-logic consumer; sees accepted traffic only, never minor errors
    void set_message_callback(MessageCallback callback) { message_callback_ = std::move(callback); }
    void set_close_callback(CloseCallback callback) { close_callback_ = std::move(callback); }

    // Handle one inbound envelope in arrival order
    void receive(const protocol::Envelope& envelope);

    // Returns false if the session is closed, general traffic is sent before
    // the handshake completed, or the peer's role does not accept the type.
    // An envelope too large for a frame closes the session with PROTOCOL_ERROR.
    bool send(const protocol::Envelope& envelope);

    // Sends Disconnect and closes
    void disconnect(protocol::DisconnectReason reason, const std::string& reason_str = {});

    // Closes without writing anything (transport gone or frame unreadable)
    void close(protocol::DisconnectReason reason);

    Role role() const { return handshake_.role(); }
    Role peer_role() const { return role() == Role::Server ? Role::Client : Role::Server; }
    HandshakePhase phase() const { return handshake_.phase(); }
    bool is_established() const { return handshake_.is_established(); }
    bool is_closed() const { return handshake_.is_closed(); }

    uint32_t local_version() const { return local_version_; }
    const std::optional<std::string>& local_version_str() const { return local_version_str_; }
    std::optional<uint32_t> peer_version() const { return peer_version_; }
    const std::optional<std::string>& peer_version_str() const { return peer_version_str_; }

    // Login name once the handshake completed
    const std::string& identity() const { return identity_; }

    const EntityTable& entities() const { return entities_; }
    const std::unordered_set<int32_t>& controlled() const { return controlled_; }
    bool controls(int32_t uid) const { return controlled_.count(uid) > 0; }

    size_t minor_errors() const { return minor_errors_; }
    std::optional<protocol::DisconnectReason> close_reason() const { return close_reason_; }

protected:
    ProtocolSession(Role role, uint32_t version, std::optional<std::string> version_str);

    // Called for every accepted message while the handshake is in progress
    virtual void handle_handshake(const protocol::Envelope& envelope) = 0;

    void advance(HandshakeEvent event);
    void deliver(const protocol::Envelope& envelope);

    // Writes Disconnect, then applies the closing event
    void finish(HandshakeEvent event, protocol::DisconnectReason reason, const std::string& reason_str);
    // Applies the closing event without writing
    void terminate(HandshakeEvent event, protocol::DisconnectReason reason);

    void protocol_error(const std::string& what);
    void minor_error(const std::string& what);

    void record_peer_version(const protocol::ConnectMsg& msg);
    protocol::ConnectMsg connect_message() const;
    void set_identity(std::string name) { identity_ = std::move(name); }

    Handshake handshake_;

private:
    void handle_traffic(const protocol::Envelope& envelope);
    void track_outbound(const protocol::Envelope& envelope);
    void write(const protocol::Envelope& envelope);

    uint32_t local_version_;
    std::optional<std::string> local_version_str_;
    std::optional<uint32_t> peer_version_;
    std::optional<std::string> peer_version_str_;
    std::string identity_;

    EntityTable entities_;
    std::unordered_set<int32_t> announced_;   // ids we have sent AddEntity for
    std::unordered_set<int32_t> controlled_;  // AssignControl grants in effect
    size_t minor_errors_ = 0;
    std::optional<protocol::DisconnectReason> close_reason_;

    SendCallback send_callback_;
    MessageCallback message_callback_;
    CloseCallback close_callback_;
};

} // namespace ghack
