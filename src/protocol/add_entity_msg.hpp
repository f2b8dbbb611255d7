#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Registers an entity id with the peer. Re-announcing a known id is
// informational, not an error.
struct AddEntityMsg : Serializable<AddEntityMsg> {
    static constexpr MessageType TYPE = MessageType::AddEntity;
    static constexpr uint32_t ENVELOPE_FIELD = 2;

    int32_t id = 0;
    std::optional<std::string> name;  // Entity type for any special handling

    bool operator==(const AddEntityMsg&) const = default;

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
        require_field(has_id, "AddEntity", "id");
    }
};

} // namespace ghack::protocol
