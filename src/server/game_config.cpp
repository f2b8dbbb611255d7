#include "game_config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace ghack::server {

bool GameConfig::load(const std::string& data_dir) {
    bool ok = true;
    ok = load_server(data_dir + "/server.json") && ok;
    ok = load_world(data_dir + "/world.json") && ok;
    ok = load_accounts(data_dir + "/accounts.json") && ok;
    return ok;
}

bool GameConfig::load_server(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        server_.default_port = j.value("default_port", protocol::DEFAULT_PORT);
        server_.protocol_version = j.value("protocol_version", protocol::PROTOCOL_VERSION);
        server_.version_str = j.value("version_str", "0.1");
        server_.max_players = j.value("max_players", size_t{64});
        server_.max_nesting_depth = j.value("max_nesting_depth", protocol::BufferReader::DEFAULT_MAX_DEPTH);
        server_.max_queued_frames = j.value("max_queued_frames", size_t{1024});
        server_.handshake_timeout_ms = j.value("handshake_timeout_ms", 10000u);
        if (server_.max_nesting_depth < 3) {
            // Envelope, payload and StateValue need three levels
            std::cerr << "[GameConfig] max_nesting_depth " << server_.max_nesting_depth
                      << " too small, using 3" << std::endl;
            server_.max_nesting_depth = 3;
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_world(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        world_.width = j.value("width", 200.0);
        world_.height = j.value("height", 200.0);
        world_.move_step = j.value("move_step", 1.0);
        world_.spawn_x = j.value("spawn_x", 10.0);
        world_.spawn_y = j.value("spawn_y", 10.0);
        world_.player_asset = j.value("player_asset", "@");
        world_.player_health = j.value("player_health", 10);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_accounts(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        auth_.require_auth = j.value("require_auth", false);

        auth_.accounts.clear();
        if (j.contains("accounts")) {
            for (const auto& a : j["accounts"]) {
                AccountConfig account;
                account.name = a.value("name", "");
                account.authtoken = a.value("authtoken", "");
                account.permissions = a.value("permissions", 0u);
                if (account.name.empty()) {
                    std::cerr << "[GameConfig] Skipping account without a name in " << path << std::endl;
                    continue;
                }
                auth_.accounts.push_back(std::move(account));
            }
        }

        auth_.banned.clear();
        if (j.contains("banned")) {
            for (const auto& name : j["banned"]) {
                auth_.banned.push_back(name.get<std::string>());
            }
        }

        std::cout << "[GameConfig] Loaded " << auth_.accounts.size() << " accounts, "
                  << auth_.banned.size() << " bans" << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace ghack::server
