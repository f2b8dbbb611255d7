#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Both directions: client opens with its protocol version, server answers
// with its own
struct ConnectMsg : Serializable<ConnectMsg> {
    static constexpr MessageType TYPE = MessageType::Connect;
    static constexpr uint32_t ENVELOPE_FIELD = 16;

    uint32_t version = 0;
    std::optional<std::string> version_str;  // e.g. git SHA1 or release number

    bool operator==(const ConnectMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_uint32_field(1, version);
        if (version_str) w.write_string_field(2, *version_str);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_version = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    version = r.read_uint32();
                    has_version = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    version_str = r.read_string();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_version, "Connect", "version");
    }
};

} // namespace ghack::protocol
