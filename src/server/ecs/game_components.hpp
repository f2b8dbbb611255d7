#pragma once

#include "protocol/vector3.hpp"
#include <cstdint>
#include <string>

namespace ghack::server::ecs {

// ============================================================================
// Core Components
// ============================================================================

// x,y form the map plane; z is carried through but not bounded
struct Transform {
    protocol::Vector3 position{0.0, 0.0, 0.0};
};

struct NetworkId {
    int32_t id = 0;
};

struct Name {
    std::string value;
};

// Glyph or model the client draws for the entity
struct Appearance {
    std::string asset;
};

struct Health {
    int32_t current = 10;
    int32_t max = 10;
};

struct KillCount {
    int32_t value = 0;
};

// ============================================================================
// Game Logic Components
// ============================================================================

struct PlayerTag {};

} // namespace ghack::server::ecs
