#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace ghack::protocol {

// CRTP base for all serializable protocol types.
// Derived must implement:
//   void serialize_impl(BufferWriter& w) const
//   void deserialize_impl(BufferReader& r)   (throws MalformedPayload)
template<typename Derived>
struct Serializable {
    // Serialize into a fresh buffer
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buf;
        BufferWriter w(buf);
        static_cast<const Derived*>(this)->serialize_impl(w);
        return buf;
    }

    // Serialize into an existing writer
    void serialize(BufferWriter& w) const {
        static_cast<const Derived*>(this)->serialize_impl(w);
    }

    // Deserialize a complete message from a span
    void deserialize(std::span<const uint8_t> data,
                     size_t max_depth = BufferReader::DEFAULT_MAX_DEPTH) {
        BufferReader r(data, max_depth);
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    // Deserialize from an existing reader (consumes it to the end)
    void deserialize(BufferReader& r) {
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    size_t size() const { return serialize().size(); }

    // Lets derived messages default their own operator==
    bool operator==(const Serializable&) const = default;
};

// Fails with the message and field name when a required field was absent
inline void require_field(bool present, const char* message, const char* field) {
    if (!present) {
        throw MalformedPayload(std::string(message) + ": missing required field '" + field + "'");
    }
}

} // namespace ghack::protocol
