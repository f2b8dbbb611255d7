#pragma once

#include "protocol/state_value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace ghack {

struct EntityRecord {
    int32_t id = 0;
    std::string name;
    std::map<std::string, protocol::StateValue> states;
};

enum class SyncResult : uint8_t {
    Applied,
    Redundant,      // AddEntity for an id that is already known
    UnknownEntity,  // Update or remove before AddEntity (minor error)
};

// Entities a peer has announced on one connection, with the latest value of
// each named state
class EntityTable {
public:
    // A re-announced id keeps its states; a supplied name replaces the old one
    SyncResult add(int32_t id, const std::optional<std::string>& name);
    SyncResult remove(int32_t id);
    SyncResult update(int32_t id, const std::string& state_id, protocol::StateValue value);

    bool contains(int32_t id) const { return entities_.find(id) != entities_.end(); }
    const EntityRecord* find(int32_t id) const;
    const protocol::StateValue* state(int32_t id, const std::string& state_id) const;

    size_t size() const { return entities_.size(); }
    void clear() { entities_.clear(); }

    const std::unordered_map<int32_t, EntityRecord>& entities() const { return entities_; }

private:
    std::unordered_map<int32_t, EntityRecord> entities_;
};

} // namespace ghack
