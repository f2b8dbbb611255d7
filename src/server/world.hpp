#pragma once

#include "common/entity_table.hpp"
#include "protocol/vector3.hpp"
#include "server/ecs/game_components.hpp"
#include "game_config.hpp"
#include <entt/entt.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ghack::server {

// State ids published for every player entity
namespace state_id {
constexpr const char* Asset = "Asset";
constexpr const char* Health = "Health";
constexpr const char* MaxHealth = "MaxHealth";
constexpr const char* KillCount = "KillCount";
constexpr const char* Position = "Position";
} // namespace state_id

class World {
public:
    explicit World(const WorldConfig& config);

    int32_t add_player(const std::string& name);
    bool remove_player(int32_t player_id);

    // Moves the player one step along direction (components clamped to
    // [-1, 1]) and keeps it inside the map. Returns the new position, or
    // nothing if the player does not exist.
    std::optional<protocol::Vector3> apply_move(int32_t player_id, const protocol::Vector3& direction);

    std::optional<EntityRecord> get_entity(int32_t network_id) const;
    std::vector<EntityRecord> get_all_entities() const;

    size_t player_count() const;

private:
    entt::entity find_entity_by_network_id(int32_t id) const;
    EntityRecord make_record(entt::entity entity) const;
    int32_t next_network_id();

    WorldConfig config_;
    mutable std::mutex mutex_;
    entt::registry registry_;
    int32_t next_id_ = 1;
};

} // namespace ghack::server
