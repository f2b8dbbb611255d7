#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include "protocol/vector3.hpp"

namespace ghack::protocol {

// Client -> Server: movement intention. The server decides the resulting
// position and reports it back through UpdateState.
struct MoveMsg : Serializable<MoveMsg> {
    static constexpr MessageType TYPE = MessageType::Move;
    static constexpr uint32_t ENVELOPE_FIELD = 5;

    Vector3 direction{0.0};

    bool operator==(const MoveMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_message_field(1, Vector3Field{direction});
    }

    void deserialize_impl(BufferReader& r) {
        bool has_direction = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            if (tag.field == 1) {
                BufferReader::expect(tag, WireType::LengthDelimited);
                BufferReader sub = r.read_message();
                direction = read_vector3(sub);
                has_direction = true;
            } else {
                r.skip_field(tag);
            }
        }
        require_field(has_direction, "Move", "direction");
    }
};

} // namespace ghack::protocol
