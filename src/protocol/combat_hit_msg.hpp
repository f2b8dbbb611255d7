#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Damage dealt in combat; informational only
struct CombatHitMsg : Serializable<CombatHitMsg> {
    static constexpr MessageType TYPE = MessageType::CombatHit;
    static constexpr uint32_t ENVELOPE_FIELD = 22;

    int32_t attacker_uid = 0;
    std::optional<std::string> attacker_name;
    int32_t victim_uid = 0;
    std::optional<std::string> victim_name;
    float damage = 0.0f;

    bool operator==(const CombatHitMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_int32_field(1, attacker_uid);
        if (attacker_name) w.write_string_field(2, *attacker_name);
        w.write_int32_field(3, victim_uid);
        if (victim_name) w.write_string_field(4, *victim_name);
        w.write_float_field(5, damage);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_attacker = false, has_victim = false, has_damage = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    attacker_uid = r.read_int32();
                    has_attacker = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    attacker_name = r.read_string();
                    break;
                case 3:
                    BufferReader::expect(tag, WireType::Varint);
                    victim_uid = r.read_int32();
                    has_victim = true;
                    break;
                case 4:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    victim_name = r.read_string();
                    break;
                case 5:
                    BufferReader::expect(tag, WireType::Fixed32);
                    damage = r.read_float();
                    has_damage = true;
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_attacker, "CombatHit", "attacker_uid");
        require_field(has_victim, "CombatHit", "victim_uid");
        require_field(has_damage, "CombatHit", "damage");
    }
};

} // namespace ghack::protocol
