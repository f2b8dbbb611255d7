#pragma once

#include "protocol/protocol.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ghack::server {

struct ServerConfig {
    uint16_t default_port = protocol::DEFAULT_PORT;
    uint32_t protocol_version = protocol::PROTOCOL_VERSION;
    std::string version_str = "0.1";
    size_t max_players = 64;
    size_t max_nesting_depth = protocol::BufferReader::DEFAULT_MAX_DEPTH;  // Decode recursion ceiling
    size_t max_queued_frames = 1024;      // Per-session send queue cap
    uint32_t handshake_timeout_ms = 10000;  // 0 disables the timer
};

struct WorldConfig {
    double width = 200.0;
    double height = 200.0;
    double move_step = 1.0;  // Distance per unit of Move direction
    double spawn_x = 10.0;
    double spawn_y = 10.0;
    std::string player_asset = "@";
    int32_t player_health = 10;
};

struct AccountConfig {
    std::string name;
    std::string authtoken;
    uint32_t permissions = 0;
};

struct AuthConfig {
    bool require_auth = false;  // Reject names without an account
    std::vector<AccountConfig> accounts;
    std::vector<std::string> banned;
};

class GameConfig {
public:
    bool load(const std::string& data_dir);

    bool load_server(const std::string& path);
    bool load_world(const std::string& path);
    bool load_accounts(const std::string& path);

    const ServerConfig& server() const { return server_; }
    const WorldConfig& world() const { return world_; }
    const AuthConfig& auth() const { return auth_; }

    ServerConfig& server() { return server_; }
    WorldConfig& world() { return world_; }
    AuthConfig& auth() { return auth_; }

private:
    ServerConfig server_;
    WorldConfig world_;
    AuthConfig auth_;
};

} // namespace ghack::server
