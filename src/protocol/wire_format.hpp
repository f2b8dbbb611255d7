#pragma once

#include <cstdint>

namespace ghack::protocol {

// Protobuf wire types. Groups (3, 4) are never produced and are rejected.
enum class WireType : uint8_t {
    Varint = 0,
    Fixed64 = 1,
    LengthDelimited = 2,
    StartGroup = 3,
    EndGroup = 4,
    Fixed32 = 5,
};

struct FieldTag {
    uint32_t field = 0;
    WireType type = WireType::Varint;
};

constexpr uint64_t make_tag(uint32_t field, WireType type) {
    return (static_cast<uint64_t>(field) << 3) | static_cast<uint8_t>(type);
}

// Longest legal varint (a sign-extended negative int32 or any uint64)
constexpr size_t MAX_VARINT_BYTES = 10;

// Largest field number protobuf allows
constexpr uint32_t MAX_FIELD_NUMBER = (1u << 29) - 1;

} // namespace ghack::protocol
