#pragma once

#include <stdexcept>
#include <string>

namespace ghack::protocol {

// Base for every codec failure that should end the connection
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bytes that do not parse against the schema (bad tag, unknown enum value,
// missing required field, nesting too deep, truncated field)
class MalformedPayload : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Envelope that serializes past the 16-bit frame length limit
class PayloadTooLarge : public ProtocolError {
public:
    explicit PayloadTooLarge(size_t size)
        : ProtocolError("payload of " + std::to_string(size) + " bytes exceeds frame limit")
        , size_(size) {}

    size_t size() const { return size_; }

private:
    size_t size_;
};

} // namespace ghack::protocol
