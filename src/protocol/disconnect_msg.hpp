#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Either direction; the sender is closed as soon as this is written
struct DisconnectMsg : Serializable<DisconnectMsg> {
    static constexpr MessageType TYPE = MessageType::Disconnect;
    static constexpr uint32_t ENVELOPE_FIELD = 17;

    DisconnectReason reason = DisconnectReason::Quit;
    std::optional<std::string> reason_str;  // Debug or kick message

    bool operator==(const DisconnectMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_enum_field(1, reason);
        if (reason_str) w.write_string_field(2, *reason_str);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_reason = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    reason = disconnect_reason_from_wire(r.read_varint());
                    has_reason = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    reason_str = r.read_string();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_reason, "Disconnect", "reason");
    }
};

} // namespace ghack::protocol
