#pragma once

#include "client_protocol.hpp"
#include "protocol/protocol.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ghack::client {

// TCP connection to a ghack server. Network I/O runs on a background thread;
// accepted messages are queued and handed out on the caller's thread by
// poll_messages().
class NetworkClient {
public:
    using tcp = asio::ip::tcp;
    using MessageCallback = std::function<void(const protocol::Envelope&)>;

    explicit NetworkClient(Credentials credentials,
                           size_t max_depth = protocol::BufferReader::DEFAULT_MAX_DEPTH);
    ~NetworkClient();

    bool connect(const std::string& host, uint16_t port);
    void disconnect();
    bool is_connected() const { return connected_; }
    bool is_established() const;

    bool send_move(const protocol::Vector3& direction);

    void set_message_callback(MessageCallback callback) { message_callback_ = std::move(callback); }

    // Process received messages on main thread
    void poll_messages();

    std::optional<int32_t> controlled_entity() const;
    // Copy of the entities the server has announced
    EntityTable entities() const;
    std::optional<protocol::DisconnectReason> close_reason() const;

private:
    void io_thread_func();
    void read();
    void handle_bytes(std::size_t length);
    void enqueue(const protocol::Envelope& envelope);
    void on_protocol_closed(protocol::DisconnectReason reason);
    void do_write();
    void close_socket();

    asio::io_context io_context_;
    tcp::socket socket_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::atomic<bool> connected_{false};

    ClientProtocol protocol_;
    mutable std::mutex protocol_mutex_;

    // Read buffer
    protocol::FrameDecoder decoder_;
    std::array<uint8_t, 4096> read_buffer_;

    // Write queue
    std::queue<std::vector<uint8_t>> write_queue_;
    std::mutex write_mutex_;
    bool writing_ = false;
    bool closing_ = false;

    // Message queue for main thread
    std::queue<protocol::Envelope> message_queue_;
    std::mutex message_mutex_;

    MessageCallback message_callback_;
};

} // namespace ghack::client
