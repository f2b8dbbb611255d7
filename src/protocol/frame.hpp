#pragma once

#include "protocol/envelope.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ghack::protocol {

// Frame = uint16 length (big-endian) + that many bytes of serialized Envelope
constexpr size_t FRAME_HEADER_SIZE = sizeof(uint16_t);
constexpr size_t MAX_FRAME_PAYLOAD = 0xFFFF;

// Build a ready-to-send frame. Throws PayloadTooLarge before producing any
// bytes if the envelope does not fit the length prefix.
inline std::vector<uint8_t> build_frame(const Envelope& envelope) {
    std::vector<uint8_t> payload = envelope.serialize();
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        throw PayloadTooLarge(payload.size());
    }
    std::vector<uint8_t> data;
    data.reserve(FRAME_HEADER_SIZE + payload.size());
    BufferWriter w(data);
    w.write_u16_be(static_cast<uint16_t>(payload.size()));
    w.write_bytes(payload);
    return data;
}

struct DecodedFrame {
    Envelope envelope;
    size_t consumed = 0;  // header + payload bytes
};

// Decode the first frame in data. Returns nullopt while the frame is
// incomplete; throws MalformedPayload once a complete frame fails to parse.
inline std::optional<DecodedFrame> decode_frame(std::span<const uint8_t> data,
                                                size_t max_depth = BufferReader::DEFAULT_MAX_DEPTH) {
    if (data.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }
    BufferReader header(data.first(FRAME_HEADER_SIZE));
    size_t length = header.read_u16_be();
    if (data.size() - FRAME_HEADER_SIZE < length) {
        return std::nullopt;
    }
    DecodedFrame frame;
    frame.envelope = Envelope::parse(data.subspan(FRAME_HEADER_SIZE, length), max_depth);
    frame.consumed = FRAME_HEADER_SIZE + length;
    return frame;
}

// Accumulates bytes from a stream transport in whatever chunks they arrive
// and hands out complete envelopes in order. A MalformedPayload from next()
// leaves the stream unrecoverable; the connection must be dropped.
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_depth = BufferReader::DEFAULT_MAX_DEPTH)
        : max_depth_(max_depth) {}

    void feed(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    std::optional<Envelope> next() {
        auto pending = std::span<const uint8_t>(buffer_).subspan(read_offset_);
        auto frame = decode_frame(pending, max_depth_);
        if (!frame) {
            compact();
            return std::nullopt;
        }
        read_offset_ += frame->consumed;
        return std::move(frame->envelope);
    }

    size_t buffered() const { return buffer_.size() - read_offset_; }

    void reset() {
        buffer_.clear();
        read_offset_ = 0;
    }

private:
    void compact() {
        if (read_offset_ > 0) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_offset_));
            read_offset_ = 0;
        }
    }

    std::vector<uint8_t> buffer_;
    size_t read_offset_ = 0;
    size_t max_depth_;
};

} // namespace ghack::protocol
