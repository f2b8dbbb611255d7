#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>

namespace ghack::protocol {

// Server -> Client: the client may issue Move for uid, or no longer may
// when revoked is set to true
struct AssignControlMsg : Serializable<AssignControlMsg> {
    static constexpr MessageType TYPE = MessageType::AssignControl;
    static constexpr uint32_t ENVELOPE_FIELD = 20;

    int32_t uid = 0;
    std::optional<bool> revoked;

    bool operator==(const AssignControlMsg&) const = default;

    bool is_revoked() const { return revoked.value_or(false); }

    void serialize_impl(BufferWriter& w) const {
        w.write_int32_field(1, uid);
        if (revoked) w.write_bool_field(2, *revoked);
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
                    BufferReader::expect(tag, WireType::Varint);
                    revoked = r.read_bool();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_uid, "AssignControl", "uid");
    }
};

} // namespace ghack::protocol
