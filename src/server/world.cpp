#include "world.hpp"
#include "protocol/state_value.hpp"
#include <glm/common.hpp>
#include <iostream>
#include <mutex>

namespace ghack::server {

using namespace ghack::protocol;

World::World(const WorldConfig& config)
    : config_(config) {
    std::cout << "[World] " << config_.width << "x" << config_.height
              << " map, spawn at (" << config_.spawn_x << ", " << config_.spawn_y << ")" << std::endl;
}

int32_t World::add_player(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entity = registry_.create();
    int32_t net_id = next_network_id();

    registry_.emplace<ecs::NetworkId>(entity, net_id);
    registry_.emplace<ecs::Name>(entity, name);
    registry_.emplace<ecs::Appearance>(entity, config_.player_asset);

    ecs::Transform transform;
    transform.position = Vector3(glm::clamp(config_.spawn_x, 0.0, config_.width),
                                 glm::clamp(config_.spawn_y, 0.0, config_.height), 0.0);
    registry_.emplace<ecs::Transform>(entity, transform);

    ecs::Health health;
    health.current = config_.player_health;
    health.max = config_.player_health;
    registry_.emplace<ecs::Health>(entity, health);
    registry_.emplace<ecs::KillCount>(entity);
    registry_.emplace<ecs::PlayerTag>(entity);

    std::cout << "[World] Spawned '" << name << "' as entity " << net_id << std::endl;
    return net_id;
}

bool World::remove_player(int32_t player_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entity = find_entity_by_network_id(player_id);
    if (entity == entt::null) {
        return false;
    }
    registry_.destroy(entity);
    return true;
}

std::optional<Vector3> World::apply_move(int32_t player_id, const Vector3& direction) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entity = find_entity_by_network_id(player_id);
    if (entity == entt::null) {
        return std::nullopt;
    }

    // The server decides positions; the client only suggests a direction
    Vector3 step = glm::clamp(direction, Vector3(-1.0), Vector3(1.0)) * config_.move_step;
    auto& transform = registry_.get<ecs::Transform>(entity);
    Vector3 pos = transform.position + step;
    pos.x = glm::clamp(pos.x, 0.0, config_.width);
    pos.y = glm::clamp(pos.y, 0.0, config_.height);
    transform.position = pos;
    return pos;
}

std::optional<EntityRecord> World::get_entity(int32_t network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entity = find_entity_by_network_id(network_id);
    if (entity == entt::null) {
        return std::nullopt;
    }
    return make_record(entity);
}

std::vector<EntityRecord> World::get_all_entities() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<EntityRecord> entities;
    auto view = registry_.view<ecs::NetworkId>();
    for (auto entity : view) {
        entities.push_back(make_record(entity));
    }
    return entities;
}

EntityRecord World::make_record(entt::entity entity) const {
    EntityRecord record;
    record.id = registry_.get<ecs::NetworkId>(entity).id;
    if (const auto* name = registry_.try_get<ecs::Name>(entity)) {
        record.name = name->value;
    }
    if (const auto* appearance = registry_.try_get<ecs::Appearance>(entity)) {
        record.states[state_id::Asset] = StateValue::string(appearance->asset);
    }
    if (const auto* health = registry_.try_get<ecs::Health>(entity)) {
        record.states[state_id::Health] = StateValue::integer(health->current);
        record.states[state_id::MaxHealth] = StateValue::integer(health->max);
    }
    if (const auto* kills = registry_.try_get<ecs::KillCount>(entity)) {
        record.states[state_id::KillCount] = StateValue::integer(kills->value);
    }
    if (const auto* transform = registry_.try_get<ecs::Transform>(entity)) {
        record.states[state_id::Position] = StateValue::vector3(transform->position);
    }
    return record;
}

entt::entity World::find_entity_by_network_id(int32_t id) const {
    auto view = registry_.view<ecs::NetworkId>();
    for (auto entity : view) {
        if (view.get<ecs::NetworkId>(entity).id == id) {
            return entity;
        }
    }
    return entt::null;
}

size_t World::player_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.view<ecs::PlayerTag>().size();
}

int32_t World::next_network_id() {
    return next_id_++;
}

} // namespace ghack::server
