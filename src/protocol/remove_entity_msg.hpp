#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// No more updates follow for this id. Removing an id that was never added
// is a minor error.
struct RemoveEntityMsg : Serializable<RemoveEntityMsg> {
    static constexpr MessageType TYPE = MessageType::RemoveEntity;
    static constexpr uint32_t ENVELOPE_FIELD = 3;

    int32_t id = 0;
    std::optional<std::string> name;  // Entity type for any special handling

    bool operator==(const RemoveEntityMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_int32_field(1, id);
        if (name) w.write_string_field(2, *name);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_id = false;
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
                    name = r.read_string();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_id, "RemoveEntity", "id");
    }
};

} // namespace ghack::protocol
