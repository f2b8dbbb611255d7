#include "session.hpp"
#include "protocol/protocol.hpp"
#include "server.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ghack::server {

using namespace ghack::protocol;

namespace {

std::string describe_endpoint(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown peer";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

Session::Session(tcp::socket socket, Server& server)
    : socket_(std::move(socket))
    , server_(server)
    , peer_(describe_endpoint(socket_))
    , protocol_(server.config().server().protocol_version, server.config().server().version_str,
                server.authenticator())
    , decoder_(server.config().server().max_nesting_depth)
    , handshake_timer_(socket_.get_executor())
    , max_queued_frames_(server.config().server().max_queued_frames) {
}

void Session::start() {
    protocol_.set_send_callback([this](const Envelope& envelope) { enqueue(envelope); });
    protocol_.set_message_callback([this](const Envelope& envelope) {
        server_.on_message(shared_from_this(), envelope);
    });
    protocol_.set_close_callback([this](DisconnectReason reason) { on_protocol_closed(reason); });

    start_handshake_timer();
    read();
}

bool Session::send(const Envelope& envelope) {
    return protocol_.send(envelope);
}

void Session::disconnect(DisconnectReason reason, const std::string& reason_str) {
    protocol_.disconnect(reason, reason_str);
}

void Session::start_handshake_timer() {
    uint32_t timeout_ms = server_.config().server().handshake_timeout_ms;
    if (timeout_ms == 0) {
        return;
    }
    auto self = shared_from_this();
    handshake_timer_.expires_after(std::chrono::milliseconds(timeout_ms));
    handshake_timer_.async_wait([this, self](asio::error_code ec) {
        if (ec || protocol_.is_established() || protocol_.is_closed()) {
            return;
        }
        std::cout << "[Session] " << peer_ << " did not finish the handshake in time" << std::endl;
        protocol_.disconnect(DisconnectReason::Kicked, "handshake timed out");
    });
}

void Session::read() {
    auto self = shared_from_this();
    socket_.async_read_some(
        asio::buffer(read_buffer_),
        [this, self](asio::error_code ec, std::size_t length) {
            if (!ec) {
                handle_bytes(length);
                if (!protocol_.is_closed()) {
                    read();
                }
            } else {
                if (ec == asio::error::eof) {
                    std::cout << "[Session] " << peer_ << " closed the connection" << std::endl;
                } else if (ec != asio::error::operation_aborted) {
                    std::cout << "[Session] " << peer_ << " read error: " << ec.message() << std::endl;
                }
                protocol_.close(DisconnectReason::Quit);
                close_socket();
            }
        });
}

void Session::handle_bytes(std::size_t length) {
    decoder_.feed(std::span<const uint8_t>(read_buffer_.data(), length));
    while (!protocol_.is_closed()) {
        std::optional<Envelope> envelope;
        try {
            envelope = decoder_.next();
        } catch (const ProtocolError& e) {
            std::cerr << "[Session] Bad frame from " << peer_ << ": " << e.what() << std::endl;
            protocol_.disconnect(DisconnectReason::ProtocolError, e.what());
            return;
        }
        if (!envelope) {
            return;
        }
        protocol_.receive(*envelope);
    }
}

void Session::enqueue(const Envelope& envelope) {
    std::vector<uint8_t> frame;
    try {
        frame = build_frame(envelope);
    } catch (const PayloadTooLarge& e) {
        std::cerr << "[Session] Dropping " << to_string(envelope.type()) << " to " << peer_
                  << ": " << e.what() << std::endl;
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self]() {
            protocol_.disconnect(DisconnectReason::ProtocolError, "outbound message too large");
        });
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_queue_.size() >= max_queued_frames_) {
        std::cerr << "[Session] Send queue to " << peer_ << " overflowed, dropping connection" << std::endl;
        write_queue_.clear();
        close_socket();
        return;
    }
    write_queue_.push_back(std::move(frame));
    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void Session::on_protocol_closed(DisconnectReason reason) {
    handshake_timer_.cancel();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        closing_ = true;
        if (!writing_) {
            close_socket();
        }
    }
    std::cout << "[Session] " << peer_ << " closed (" << to_string(reason) << ")" << std::endl;
    server_.on_session_closed(shared_from_this());
}

void Session::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        if (closing_) {
            close_socket();
        }
        return;
    }

    auto self = shared_from_this();
    auto& front = write_queue_.front();
    asio::async_write(socket_,
        asio::buffer(front),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!ec) {
                write_queue_.pop_front();
                do_write();
            } else {
                if (ec != asio::error::operation_aborted) {
                    std::cout << "[Session] " << peer_ << " write error: " << ec.message() << std::endl;
                }
                write_queue_.clear();
                writing_ = false;
                close_socket();
            }
        });
}

void Session::close_socket() {
    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace ghack::server
