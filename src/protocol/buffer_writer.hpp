#pragma once

#include "protocol/wire_format.hpp"
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace ghack::protocol {

// Append-only writer for the protobuf-compatible wire encoding.
// Grows the target vector on each write.
class BufferWriter {
    std::vector<uint8_t>* vec_;

public:
    explicit BufferWriter(std::vector<uint8_t>& buf) : vec_(&buf) {}

    void write_u8(uint8_t val) { vec_->push_back(val); }

    // Network byte order, used only for the frame length prefix
    void write_u16_be(uint16_t val) {
        vec_->push_back(static_cast<uint8_t>(val >> 8));
        vec_->push_back(static_cast<uint8_t>(val & 0xFF));
    }

    void write_varint(uint64_t val) {
        while (val >= 0x80) {
            vec_->push_back(static_cast<uint8_t>(val | 0x80));
            val >>= 7;
        }
        vec_->push_back(static_cast<uint8_t>(val));
    }

    void write_fixed32(uint32_t val) {
        for (int i = 0; i < 4; ++i) {
            vec_->push_back(static_cast<uint8_t>(val >> (i * 8)));
        }
    }

    void write_fixed64(uint64_t val) {
        for (int i = 0; i < 8; ++i) {
            vec_->push_back(static_cast<uint8_t>(val >> (i * 8)));
        }
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        vec_->insert(vec_->end(), bytes.begin(), bytes.end());
    }

    void write_bytes(const void* src, size_t len) {
        write_bytes(std::span<const uint8_t>(static_cast<const uint8_t*>(src), len));
    }

    void write_tag(uint32_t field, WireType type) {
        write_varint(make_tag(field, type));
    }

    // Field helpers: tag followed by the value in its wire representation

    void write_uint32_field(uint32_t field, uint32_t val) {
        write_tag(field, WireType::Varint);
        write_varint(val);
    }

    // int32 is sign-extended to 64 bits, so negatives take 10 bytes
    void write_int32_field(uint32_t field, int32_t val) {
        write_tag(field, WireType::Varint);
        write_varint(static_cast<uint64_t>(static_cast<int64_t>(val)));
    }

    void write_bool_field(uint32_t field, bool val) {
        write_tag(field, WireType::Varint);
        write_varint(val ? 1 : 0);
    }

    template<typename E>
    void write_enum_field(uint32_t field, E val) {
        write_int32_field(field, static_cast<int32_t>(val));
    }

    void write_float_field(uint32_t field, float val) {
        uint32_t bits;
        std::memcpy(&bits, &val, sizeof(bits));
        write_tag(field, WireType::Fixed32);
        write_fixed32(bits);
    }

    void write_double_field(uint32_t field, double val) {
        uint64_t bits;
        std::memcpy(&bits, &val, sizeof(bits));
        write_tag(field, WireType::Fixed64);
        write_fixed64(bits);
    }

    void write_string_field(uint32_t field, const std::string& str) {
        write_tag(field, WireType::LengthDelimited);
        write_varint(str.size());
        write_bytes(str.data(), str.size());
    }

    // Nested message: encoded into scratch space first since the length
    // prefix must precede it
    template<typename T>
    void write_message_field(uint32_t field, const T& msg) {
        std::vector<uint8_t> scratch;
        BufferWriter sub(scratch);
        msg.serialize(sub);
        write_tag(field, WireType::LengthDelimited);
        write_varint(scratch.size());
        write_bytes(scratch);
    }

    // Repeated message field: one tagged entry per element
    template<typename T>
    void write_repeated_field(uint32_t field, const std::vector<T>& items) {
        for (const auto& item : items) {
            write_message_field(field, item);
        }
    }

    size_t offset() const { return vec_->size(); }
};

} // namespace ghack::protocol
