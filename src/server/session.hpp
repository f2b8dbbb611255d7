#pragma once

#include "protocol/protocol.hpp"
#include "server_protocol.hpp"
#include <asio.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ghack::server {

class Server;

// One TCP connection: reads frames into the protocol state machine and
// queues outbound frames
class Session : public std::enable_shared_from_this<Session> {
public:
    using tcp = asio::ip::tcp;

    Session(tcp::socket socket, Server& server);

    void start();

    // Queues an envelope through the protocol checks
    bool send(const protocol::Envelope& envelope);

    // Sends Disconnect, flushes, then closes the socket
    void disconnect(protocol::DisconnectReason reason, const std::string& reason_str = {});

    int32_t player_id() const { return player_id_; }
    void set_player_id(int32_t id) { player_id_ = id; }

    const std::string& peer() const { return peer_; }
    const ServerProtocol& protocol() const { return protocol_; }
    bool is_established() const { return protocol_.is_established(); }
    bool is_open() const { return socket_.is_open(); }

private:
    void read();
    void handle_bytes(std::size_t length);
    void start_handshake_timer();
    void enqueue(const protocol::Envelope& envelope);
    void on_protocol_closed(protocol::DisconnectReason reason);
    void do_write();
    void close_socket();

    tcp::socket socket_;
    Server& server_;
    std::string peer_;
    int32_t player_id_ = 0;

    ServerProtocol protocol_;
    protocol::FrameDecoder decoder_;
    std::array<uint8_t, 4096> read_buffer_;
    asio::steady_timer handshake_timer_;

    // Write queue
    std::deque<std::vector<uint8_t>> write_queue_;
    size_t max_queued_frames_;
    bool writing_ = false;
    bool closing_ = false;  // Close the socket once the queue drains
    std::mutex write_mutex_;
};

} // namespace ghack::server
