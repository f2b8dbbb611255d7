#pragma once

#include "protocol/errors.hpp"
#include "protocol/wire_format.hpp"
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace ghack::protocol {

// Bounds-checked reader for the protobuf-compatible wire encoding.
// Every failure throws MalformedPayload. Nested messages are read through
// child readers that carry the nesting depth, so recursive values cannot
// run past max_depth.
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
    size_t depth_ = 0;
    size_t max_depth_;

    void check_bounds(size_t n) const {
        if (n > data_.size() - offset_) {
            throw MalformedPayload("BufferReader: read past end of buffer");
        }
    }

    BufferReader(std::span<const uint8_t> data, size_t depth, size_t max_depth)
        : data_(data), depth_(depth), max_depth_(max_depth) {}

public:
    static constexpr size_t DEFAULT_MAX_DEPTH = 64;

    explicit BufferReader(std::span<const uint8_t> data, size_t max_depth = DEFAULT_MAX_DEPTH)
        : data_(data), max_depth_(max_depth) {}

    uint8_t read_u8() {
        check_bounds(1);
        return data_[offset_++];
    }

    uint16_t read_u16_be() {
        check_bounds(2);
        uint16_t val = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return val;
    }

    uint64_t read_varint() {
        uint64_t val = 0;
        for (size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
            uint8_t byte = read_u8();
            val |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
            if ((byte & 0x80) == 0) {
                return val;
            }
        }
        throw MalformedPayload("BufferReader: varint longer than 10 bytes");
    }

    uint32_t read_fixed32() {
        check_bounds(4);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            val |= static_cast<uint32_t>(data_[offset_ + i]) << (i * 8);
        }
        offset_ += 4;
        return val;
    }

    uint64_t read_fixed64() {
        check_bounds(8);
        uint64_t val = 0;
        for (int i = 0; i < 8; ++i) {
            val |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
        }
        offset_ += 8;
        return val;
    }

    FieldTag read_tag() {
        uint64_t raw = read_varint();
        uint64_t field = raw >> 3;
        auto type = static_cast<WireType>(raw & 0x07);
        if (field == 0 || field > MAX_FIELD_NUMBER) {
            throw MalformedPayload("BufferReader: invalid field number " + std::to_string(field));
        }
        if (type == WireType::StartGroup || type == WireType::EndGroup ||
            static_cast<uint8_t>(type) > static_cast<uint8_t>(WireType::Fixed32)) {
            throw MalformedPayload("BufferReader: unsupported wire type " +
                                   std::to_string(static_cast<int>(type)));
        }
        return FieldTag{static_cast<uint32_t>(field), type};
    }

    // Fails when a known field arrives with a different wire type
    static void expect(const FieldTag& tag, WireType type) {
        if (tag.type != type) {
            throw MalformedPayload("BufferReader: field " + std::to_string(tag.field) +
                                   " has wrong wire type");
        }
    }

    uint32_t read_uint32() { return static_cast<uint32_t>(read_varint()); }

    // Low 32 bits, matching protobuf int32 truncation
    int32_t read_int32() { return static_cast<int32_t>(static_cast<uint32_t>(read_varint())); }

    bool read_bool() { return read_varint() != 0; }

    float read_float() {
        uint32_t bits = read_fixed32();
        float val;
        std::memcpy(&val, &bits, sizeof(val));
        return val;
    }

    double read_double() {
        uint64_t bits = read_fixed64();
        double val;
        std::memcpy(&val, &bits, sizeof(val));
        return val;
    }

    std::span<const uint8_t> read_length_delimited() {
        uint64_t len = read_varint();
        if (len > remaining_size()) {
            throw MalformedPayload("BufferReader: length-delimited field past end of buffer");
        }
        auto bytes = data_.subspan(offset_, static_cast<size_t>(len));
        offset_ += static_cast<size_t>(len);
        return bytes;
    }

    std::string read_string() {
        auto bytes = read_length_delimited();
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    // Reader over a nested message, one level deeper than this one
    BufferReader child(std::span<const uint8_t> bytes) const {
        if (depth_ + 1 > max_depth_) {
            throw MalformedPayload("BufferReader: nesting deeper than " + std::to_string(max_depth_));
        }
        return BufferReader(bytes, depth_ + 1, max_depth_);
    }

    BufferReader read_message() { return child(read_length_delimited()); }

    void skip_field(const FieldTag& tag) {
        switch (tag.type) {
            case WireType::Varint: read_varint(); break;
            case WireType::Fixed64: check_bounds(8); offset_ += 8; break;
            case WireType::LengthDelimited: read_length_delimited(); break;
            case WireType::Fixed32: check_bounds(4); offset_ += 4; break;
            default:
                throw MalformedPayload("BufferReader: cannot skip wire type " +
                                       std::to_string(static_cast<int>(tag.type)));
        }
    }

    bool at_end() const { return offset_ >= data_.size(); }
    size_t offset() const { return offset_; }
    size_t depth() const { return depth_; }
    size_t max_depth() const { return max_depth_; }
    size_t remaining_size() const { return data_.size() - offset_; }
    std::span<const uint8_t> remaining() const { return data_.subspan(offset_); }
};

} // namespace ghack::protocol
