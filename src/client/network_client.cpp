#include "network_client.hpp"
#include "protocol/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ghack::client {

using namespace ghack::protocol;

NetworkClient::NetworkClient(Credentials credentials, size_t max_depth)
    : socket_(io_context_)
    , protocol_(PROTOCOL_VERSION, std::nullopt, std::move(credentials))
    , decoder_(max_depth) {
    protocol_.set_send_callback([this](const Envelope& envelope) { enqueue(envelope); });
    protocol_.set_message_callback([this](const Envelope& envelope) {
        std::lock_guard<std::mutex> lock(message_mutex_);
        message_queue_.push(envelope);
    });
    protocol_.set_close_callback([this](DisconnectReason reason) { on_protocol_closed(reason); });
}

NetworkClient::~NetworkClient() {
    disconnect();
}

bool NetworkClient::connect(const std::string& host, uint16_t port) {
    try {
        tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host, std::to_string(port));

        asio::connect(socket_, endpoints);
        connected_ = true;

        work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));

        read();
        {
            std::lock_guard<std::mutex> lock(protocol_mutex_);
            protocol_.start();
        }

        io_thread_ = std::thread(&NetworkClient::io_thread_func, this);

        std::cout << "[Client] Connected to server " << host << ":" << port << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Client] Connection failed: " << e.what() << std::endl;
        return false;
    }
}

void NetworkClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(protocol_mutex_);
        if (connected_ && !protocol_.is_closed()) {
            protocol_.quit();
        }
    }

    // The socket closes once the Disconnect frame is flushed
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    connected_ = false;
}

bool NetworkClient::is_established() const {
    std::lock_guard<std::mutex> lock(protocol_mutex_);
    return protocol_.is_established();
}

bool NetworkClient::send_move(const Vector3& direction) {
    if (!connected_) return false;

    std::lock_guard<std::mutex> lock(protocol_mutex_);
    return protocol_.move(direction);
}

void NetworkClient::poll_messages() {
    std::queue<Envelope> messages;
    {
        std::lock_guard<std::mutex> lock(message_mutex_);
        std::swap(messages, message_queue_);
    }

    while (!messages.empty()) {
        if (message_callback_) {
            message_callback_(messages.front());
        }
        messages.pop();
    }
}

std::optional<int32_t> NetworkClient::controlled_entity() const {
    std::lock_guard<std::mutex> lock(protocol_mutex_);
    return protocol_.controlled_entity();
}

EntityTable NetworkClient::entities() const {
    std::lock_guard<std::mutex> lock(protocol_mutex_);
    return protocol_.entities();
}

std::optional<DisconnectReason> NetworkClient::close_reason() const {
    std::lock_guard<std::mutex> lock(protocol_mutex_);
    return protocol_.close_reason();
}

void NetworkClient::io_thread_func() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        std::cerr << "[Client] IO thread error: " << e.what() << std::endl;
    }
}

void NetworkClient::read() {
    socket_.async_read_some(
        asio::buffer(read_buffer_),
        [this](asio::error_code ec, std::size_t length) {
            if (!ec) {
                handle_bytes(length);
                std::lock_guard<std::mutex> lock(protocol_mutex_);
                if (!protocol_.is_closed()) {
                    read();
                }
            } else {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    std::cerr << "[Client] Read error: " << ec.message() << std::endl;
                }
                {
                    std::lock_guard<std::mutex> lock(protocol_mutex_);
                    protocol_.close(DisconnectReason::Quit);
                }
                connected_ = false;
                close_socket();
            }
        });
}

void NetworkClient::handle_bytes(std::size_t length) {
    std::lock_guard<std::mutex> lock(protocol_mutex_);
    decoder_.feed(std::span<const uint8_t>(read_buffer_.data(), length));
    while (!protocol_.is_closed()) {
        std::optional<Envelope> envelope;
        try {
            envelope = decoder_.next();
        } catch (const ProtocolError& e) {
            std::cerr << "[Client] Bad frame from server: " << e.what() << std::endl;
            protocol_.disconnect(DisconnectReason::ProtocolError, e.what());
            return;
        }
        if (!envelope) {
            return;
        }
        protocol_.receive(*envelope);
    }
}

void NetworkClient::enqueue(const Envelope& envelope) {
    std::vector<uint8_t> frame;
    try {
        frame = build_frame(envelope);
    } catch (const PayloadTooLarge& e) {
        std::cerr << "[Client] Dropping " << to_string(envelope.type()) << ": " << e.what() << std::endl;
        asio::post(io_context_, [this]() {
            std::lock_guard<std::mutex> lock(protocol_mutex_);
            protocol_.disconnect(DisconnectReason::ProtocolError, "outbound message too large");
        });
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_queue_.push(std::move(frame));
    if (!writing_) {
        writing_ = true;
        asio::post(io_context_, [this]() {
            std::lock_guard<std::mutex> lock(write_mutex_);
            do_write();
        });
    }
}

void NetworkClient::on_protocol_closed(DisconnectReason reason) {
    connected_ = false;
    std::cout << "[Client] Connection closed (" << to_string(reason) << ")" << std::endl;

    std::lock_guard<std::mutex> lock(write_mutex_);
    closing_ = true;
    if (!writing_) {
        asio::post(io_context_, [this]() { close_socket(); });
    }
}

void NetworkClient::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        if (closing_) {
            close_socket();
        }
        return;
    }

    auto& front = write_queue_.front();
    asio::async_write(socket_,
        asio::buffer(front),
        [this](asio::error_code ec, std::size_t /*length*/) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!ec) {
                write_queue_.pop();
                do_write();
            } else {
                std::cerr << "[Client] Write error: " << ec.message() << std::endl;
                while (!write_queue_.empty()) write_queue_.pop();
                writing_ = false;
                close_socket();
            }
        });
}

void NetworkClient::close_socket() {
    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace ghack::client
