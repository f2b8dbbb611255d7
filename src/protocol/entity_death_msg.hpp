#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Broadcast notification, no state change implied
struct EntityDeathMsg : Serializable<EntityDeathMsg> {
    static constexpr MessageType TYPE = MessageType::EntityDeath;
    static constexpr uint32_t ENVELOPE_FIELD = 21;

    int32_t uid = 0;
    std::optional<std::string> name;
    std::optional<int32_t> killer_uid;
    std::optional<std::string> killer_name;

    bool operator==(const EntityDeathMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_int32_field(1, uid);
        if (name) w.write_string_field(2, *name);
        if (killer_uid) w.write_int32_field(3, *killer_uid);
        if (killer_name) w.write_string_field(4, *killer_name);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_uid = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    uid = r.read_int32();
                    has_uid = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    name = r.read_string();
                    break;
                case 3:
                    BufferReader::expect(tag, WireType::Varint);
                    killer_uid = r.read_int32();
                    break;
                case 4:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    killer_name = r.read_string();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_uid, "EntityDeath", "uid");
    }
};

} // namespace ghack::protocol
