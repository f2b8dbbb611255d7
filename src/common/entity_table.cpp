#include "entity_table.hpp"
#include <utility>

namespace ghack {

SyncResult EntityTable::add(int32_t id, const std::optional<std::string>& name) {
    auto it = entities_.find(id);
    if (it != entities_.end()) {
        if (name) {
            it->second.name = *name;
        }
        return SyncResult::Redundant;
    }
    EntityRecord record;
    record.id = id;
    record.name = name.value_or("");
    entities_.emplace(id, std::move(record));
    return SyncResult::Applied;
}

SyncResult EntityTable::remove(int32_t id) {
    return entities_.erase(id) > 0 ? SyncResult::Applied : SyncResult::UnknownEntity;
}

SyncResult EntityTable::update(int32_t id, const std::string& state_id, protocol::StateValue value) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return SyncResult::UnknownEntity;
    }
    it->second.states.insert_or_assign(state_id, std::move(value));
    return SyncResult::Applied;
}

const EntityRecord* EntityTable::find(int32_t id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

const protocol::StateValue* EntityTable::state(int32_t id, const std::string& state_id) const {
    const EntityRecord* record = find(id);
    if (!record) {
        return nullptr;
    }
    auto it = record->states.find(state_id);
    return it != record->states.end() ? &it->second : nullptr;
}

} // namespace ghack
