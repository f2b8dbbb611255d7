#include "server.hpp"
#include "protocol/protocol.hpp"
#include "server/game_config.hpp"
#include "server/session.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ghack::server {

using namespace ghack::protocol;

Server::Server(asio::io_context& io_context, uint16_t port, const GameConfig& config)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , drain_timer_(io_context)
    , config_(config)
    , world_(config.world())
    , authenticator_(config.auth(), config.server().max_players, [this]() { return world_.player_count(); }) {
}

Server::~Server() {
    stop();
}

uint16_t Server::port() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Server::start() {
    running_ = true;
    accept();
    std::cout << "[Server] Listening on port " << port() << ", protocol version "
              << config_.server().protocol_version << std::endl;
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    for (auto& session : sessions) {
        session->disconnect(DisconnectReason::Kicked, "server shutting down");
    }
}

void Server::shutdown(std::chrono::milliseconds grace) {
    stop();
    drain_timer_.expires_after(grace);
    drain_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec != asio::error::operation_aborted) {
            io_context_.stop();
        }
    });
}

void Server::accept() {
    acceptor_.async_accept(
        [this](asio::error_code ec, tcp::socket socket) {
            if (!ec) {
                auto session = std::make_shared<Session>(std::move(socket), *this);
                std::cout << "[Server] New connection from " << session->peer() << std::endl;
                session->start();
            } else if (ec != asio::error::operation_aborted) {
                std::cerr << "[Server] Accept failed: " << ec.message() << std::endl;
            }

            if (running_) {
                accept();
            }
        });
}

void Server::on_message(std::shared_ptr<Session> session, const Envelope& envelope) {
    if (const auto* msg = envelope.get<LoginMsg>()) {
        on_login(session, *msg);
    } else if (const auto* msg = envelope.get<MoveMsg>()) {
        on_move(session, *msg);
    } else if (envelope.is<DisconnectMsg>()) {
        // Cleanup happens in on_session_closed
    } else {
        std::cout << "[Server] Ignoring " << to_string(envelope.type()) << " from "
                  << session->peer() << std::endl;
    }
}

void Server::on_login(const std::shared_ptr<Session>& session, const LoginMsg& login) {
    int32_t player_id = world_.add_player(login.name);
    session->set_player_id(player_id);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[player_id] = session;
    }

    // Everything already in the world, the new player included
    for (const auto& record : world_.get_all_entities()) {
        send_entity(*session, record);
    }

    AssignControlMsg control;
    control.uid = player_id;
    session->send(control);

    std::cout << "[Server] Player '" << login.name << "' controls entity " << player_id
              << " (permissions " << session->protocol().permissions() << ")" << std::endl;

    if (auto record = world_.get_entity(player_id)) {
        for (auto& other : established_sessions()) {
            if (other->player_id() != player_id) {
                send_entity(*other, *record);
            }
        }
    }
}

void Server::on_move(const std::shared_ptr<Session>& session, const MoveMsg& move) {
    int32_t player_id = session->player_id();
    auto position = world_.apply_move(player_id, move.direction);
    if (!position) {
        std::cerr << "[Server] Move from " << session->peer() << " without a player entity" << std::endl;
        return;
    }

    UpdateStateMsg update;
    update.id = player_id;
    update.state_id = state_id::Position;
    update.value = StateValue::vector3(*position);
    broadcast(update);
}

void Server::on_session_closed(std::shared_ptr<Session> session) {
    int32_t player_id = session->player_id();
    if (player_id == 0) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(player_id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }

    auto record = world_.get_entity(player_id);
    if (!world_.remove_player(player_id)) {
        return;
    }
    session->set_player_id(0);

    std::cout << "[Server] Player " << player_id << " left" << std::endl;

    RemoveEntityMsg remove;
    remove.id = player_id;
    if (record) {
        remove.name = record->name;
    }
    broadcast(remove);
}

void Server::broadcast(const Envelope& envelope) {
    for (auto& session : established_sessions()) {
        session->send(envelope);
    }
}

void Server::send_entity(Session& session, const EntityRecord& record) {
    AddEntityMsg add;
    add.id = record.id;
    if (!record.name.empty()) {
        add.name = record.name;
    }
    session.send(add);

    for (const auto& [id, value] : record.states) {
        UpdateStateMsg update;
        update.id = record.id;
        update.state_id = id;
        update.value = value;
        session.send(update);
    }
}

std::vector<std::shared_ptr<Session>> Server::established_sessions() {
    std::vector<std::shared_ptr<Session>> result;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        if (session->is_established() && session->is_open()) {
            result.push_back(session);
        }
    }
    return result;
}

} // namespace ghack::server
