#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/serializable.hpp"
#include <glm/vec3.hpp>

namespace ghack::protocol {

// Three double components, all required on the wire
using Vector3 = glm::dvec3;

inline void write_vector3(BufferWriter& w, const Vector3& v) {
    w.write_double_field(1, v.x);
    w.write_double_field(2, v.y);
    w.write_double_field(3, v.z);
}

inline Vector3 read_vector3(BufferReader& r) {
    Vector3 v{0.0};
    bool has_x = false, has_y = false, has_z = false;
    while (!r.at_end()) {
        FieldTag tag = r.read_tag();
        switch (tag.field) {
            case 1: BufferReader::expect(tag, WireType::Fixed64); v.x = r.read_double(); has_x = true; break;
            case 2: BufferReader::expect(tag, WireType::Fixed64); v.y = r.read_double(); has_y = true; break;
            case 3: BufferReader::expect(tag, WireType::Fixed64); v.z = r.read_double(); has_z = true; break;
            default: r.skip_field(tag); break;
        }
    }
    require_field(has_x, "Vector3", "x");
    require_field(has_y, "Vector3", "y");
    require_field(has_z, "Vector3", "z");
    return v;
}

// Adapter so a Vector3 can go through BufferWriter::write_message_field
struct Vector3Field {
    const Vector3& value;
    void serialize(BufferWriter& w) const { write_vector3(w, value); }
};

} // namespace ghack::protocol
