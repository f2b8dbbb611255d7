#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include "protocol/state_value.hpp"
#include <string>

namespace ghack::protocol {

// Sets one named state of an entity. Must follow an AddEntity for the same
// id; otherwise it is a minor error.
struct UpdateStateMsg : Serializable<UpdateStateMsg> {
    static constexpr MessageType TYPE = MessageType::UpdateState;
    static constexpr uint32_t ENVELOPE_FIELD = 4;

    int32_t id = 0;
    std::string state_id;
    StateValue value;

    bool operator==(const UpdateStateMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_int32_field(1, id);
        w.write_string_field(2, state_id);
        w.write_message_field(3, value);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_id = false, has_state_id = false, has_value = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    id = r.read_int32();
                    has_id = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    state_id = r.read_string();
                    has_state_id = true;
                    break;
                case 3: {
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    BufferReader sub = r.read_message();
                    value.deserialize(sub);
                    has_value = true;
                    break;
                }
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_id, "UpdateState", "id");
        require_field(has_state_id, "UpdateState", "state_id");
        require_field(has_value, "UpdateState", "value");
    }
};

} // namespace ghack::protocol
