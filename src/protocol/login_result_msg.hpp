#pragma once

#include "protocol/message_type.hpp"
#include "protocol/serializable.hpp"
#include <optional>

namespace ghack::protocol {

// Server -> Client: outcome of Login. reason is only meaningful on failure.
struct LoginResultMsg : Serializable<LoginResultMsg> {
    static constexpr MessageType TYPE = MessageType::LoginResult;
    static constexpr uint32_t ENVELOPE_FIELD = 19;

    bool succeeded = false;
    std::optional<LoginReason> reason;

    bool operator==(const LoginResultMsg&) const = default;

    void serialize_impl(BufferWriter& w) const {
        w.write_bool_field(1, succeeded);
        if (reason) w.write_enum_field(2, *reason);
    }

    void deserialize_impl(BufferReader& r) {
        bool has_succeeded = false;
        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1:
                    BufferReader::expect(tag, WireType::Varint);
                    succeeded = r.read_bool();
                    has_succeeded = true;
                    break;
                case 2:
                    BufferReader::expect(tag, WireType::Varint);
                    reason = login_reason_from_wire(r.read_varint());
                    break;
                default:
                    r.skip_field(tag);
                    break;
            }
        }
        require_field(has_succeeded, "LoginResult", "succeeded");
    }
};

} // namespace ghack::protocol
