#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>
#include <string>

namespace ghack::protocol {

// Client -> Server after the Connect exchange
struct LoginMsg : Serializable<LoginMsg> {
    static constexpr MessageType TYPE = MessageType::Login;
    static constexpr uint32_t ENVELOPE_FIELD = 18;

    std::string name;
    std::optional<std::string> authtoken;  // aka password
    std::optional<uint32_t> permissions;   // Requested permission set

    bool operator==(const LoginMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_string_field(1, name);
        if (authtoken) w.write_string_field(2, *authtoken);
        if (permissions) w.write_uint32_field(3, *permissions);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_name = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    name = r.read_string();
                    has_name = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    authtoken = r.read_string();
                    break;
                case 3:
                    BufferReader::expect(tag, WireType::Varint);
                    permissions = r.read_uint32();
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_name, "Login", "name");
    }
};

} // namespace ghack::protocol
