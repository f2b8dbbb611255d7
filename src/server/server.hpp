#pragma once

#include "protocol/protocol.hpp"
#include "authenticator.hpp"
#include "game_config.hpp"
#include "world.hpp"
#include "session.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ghack::server {

class Server {
public:
    using tcp = asio::ip::tcp;

    Server(asio::io_context& io_context, uint16_t port, const GameConfig& config);
    ~Server();

    void start();
    void stop();
    // stop(), then ends the io loop once the Disconnect frames had grace to flush
    void shutdown(std::chrono::milliseconds grace);

    // Accepted traffic from an established session (and its Login)
    void on_message(std::shared_ptr<Session> session, const protocol::Envelope& envelope);
    void on_session_closed(std::shared_ptr<Session> session);

    void broadcast(const protocol::Envelope& envelope);

    const GameConfig& config() const { return config_; }
    Authenticator& authenticator() { return authenticator_; }
    World& world() { return world_; }
    uint16_t port() const;

private:
    void accept();
    void on_login(const std::shared_ptr<Session>& session, const protocol::LoginMsg& login);
    void on_move(const std::shared_ptr<Session>& session, const protocol::MoveMsg& move);

    // AddEntity followed by one UpdateState per state
    static void send_entity(Session& session, const EntityRecord& record);
    std::vector<std::shared_ptr<Session>> established_sessions();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    asio::steady_timer drain_timer_;
    const GameConfig& config_;
    World world_;
    AccountAuthenticator authenticator_;

    std::unordered_map<int32_t, std::shared_ptr<Session>> sessions_;
    std::mutex sessions_mutex_;

    std::atomic<bool> running_{false};
};

} // namespace ghack::server
