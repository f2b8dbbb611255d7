#pragma once

#include "protocol/serializable.hpp"
#include "protocol/vector3.hpp"
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ghack::protocol {

// Recursive tagged union carried by UpdateState. The active alternative is
// the discriminant, so a value whose type and payload disagree cannot exist.
// Arrays own their elements; copies are deep.
class StateValue : public Serializable<StateValue> {
public:
    // Wire values of StateValue.type
    enum class Type : uint8_t {
        Bool = 1,
        Int = 2,
        Float = 3,
        String = 4,
        Array = 5,
        Vector3 = 6,
    };

    using Array = std::vector<StateValue>;
    // Alternative order follows Type: index + 1 == wire discriminant
    using Storage = std::variant<bool, int32_t, float, std::string, Array, Vector3>;

    StateValue() = default;

    // Checked construction from a separately supplied discriminant.
    // Throws std::invalid_argument when the payload does not match.
    StateValue(Type type, Storage value) : value_(std::move(value)) {
        if (static_cast<size_t>(type) != value_.index() + 1) {
            throw std::invalid_argument(std::string("StateValue: ") + type_name(type) +
                                        " discriminant with " + type_name(this->type()) + " payload");
        }
    }

    static StateValue boolean(bool v) { return StateValue(Storage(std::in_place_index<0>, v)); }
    static StateValue integer(int32_t v) { return StateValue(Storage(std::in_place_index<1>, v)); }
    static StateValue real(float v) { return StateValue(Storage(std::in_place_index<2>, v)); }
    static StateValue string(std::string v) { return StateValue(Storage(std::in_place_index<3>, std::move(v))); }
    static StateValue array(Array v) { return StateValue(Storage(std::in_place_index<4>, std::move(v))); }
    static StateValue vector3(const Vector3& v) { return StateValue(Storage(std::in_place_index<5>, v)); }

    Type type() const { return static_cast<Type>(value_.index() + 1); }

    bool is(Type t) const { return type() == t; }

    // Typed access; throws std::bad_variant_access on a type mismatch
    bool as_bool() const { return std::get<0>(value_); }
    int32_t as_int() const { return std::get<1>(value_); }
    float as_float() const { return std::get<2>(value_); }
    const std::string& as_string() const { return std::get<3>(value_); }
    const Array& as_array() const { return std::get<4>(value_); }
    const Vector3& as_vector3() const { return std::get<5>(value_); }

    const Storage& storage() const { return value_; }

    StateValue clone() const { return *this; }

    bool operator==(const StateValue& other) const { return value_ == other.value_; }
    bool operator!=(const StateValue& other) const { return !(*this == other); }

    static const char* type_name(Type t) {
        switch (t) {
            case Type::Bool: return "Bool";
            case Type::Int: return "Int";
            case Type::Float: return "Float";
            case Type::String: return "String";
            case Type::Array: return "Array";
            case Type::Vector3: return "Vector3";
        }
        return "Unknown";
    }

    void serialize_impl(BufferWriter& w) const {
        w.write_enum_field(1, type());
        switch (type()) {
            case Type::Bool: w.write_bool_field(2, as_bool()); break;
            case Type::Int: w.write_int32_field(3, as_int()); break;
            case Type::Float: w.write_float_field(4, as_float()); break;
            case Type::String: w.write_string_field(5, as_string()); break;
            case Type::Vector3: w.write_message_field(6, Vector3Field{as_vector3()}); break;
            case Type::Array: w.write_repeated_field(15, as_array()); break;
        }
    }

    // Requires the field matching `type` (an Array may be empty) and rejects
    // any other populated value field
    void deserialize_impl(BufferReader& r) {
        bool has_type = false;
        Type wire_type = Type::Bool;
        uint8_t populated = 0;  // bit (Type - 1) per value field seen
        bool b = false;
        int32_t i = 0;
        float f = 0.0f;
        std::string s;
        Vector3 v{0.0};
        Array arr;

        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            switch (tag.field) {
                case 1: {
                    BufferReader::expect(tag, WireType::Varint);
                    uint64_t raw = r.read_varint();
                    if (raw < 1 || raw > 6) {
                        throw MalformedPayload("StateValue: unknown type " + std::to_string(raw));
                    }
                    wire_type = static_cast<Type>(raw);
                    has_type = true;
                    break;
                }
                case 2:
                    BufferReader::expect(tag, WireType::Varint);
                    b = r.read_bool();
                    populated |= bit(Type::Bool);
                    break;
                case 3:
                    BufferReader::expect(tag, WireType::Varint);
                    i = r.read_int32();
                    populated |= bit(Type::Int);
                    break;
                case 4:
                    BufferReader::expect(tag, WireType::Fixed32);
                    f = r.read_float();
                    populated |= bit(Type::Float);
                    break;
                case 5:
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    s = r.read_string();
                    populated |= bit(Type::String);
                    break;
                case 6: {
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    BufferReader sub = r.read_message();
                    v = read_vector3(sub);
                    populated |= bit(Type::Vector3);
                    break;
                }
                case 15: {
                    BufferReader::expect(tag, WireType::LengthDelimited);
                    BufferReader sub = r.read_message();
                    StateValue element;
                    element.deserialize(sub);
                    arr.push_back(std::move(element));
                    populated |= bit(Type::Array);
                    break;
                }
                default:
                    r.skip_field(tag);
                    break;
            }
        }

        require_field(has_type, "StateValue", "type");
        if ((populated & ~bit(wire_type)) != 0) {
            throw MalformedPayload(std::string("StateValue: ") + type_name(wire_type) +
                                   " value carries a field of another type");
        }
        if (wire_type != Type::Array && (populated & bit(wire_type)) == 0) {
            throw MalformedPayload(std::string("StateValue: ") + type_name(wire_type) +
                                   " value is missing its field");
        }

        switch (wire_type) {
            case Type::Bool: value_.emplace<0>(b); break;
            case Type::Int: value_.emplace<1>(i); break;
            case Type::Float: value_.emplace<2>(f); break;
            case Type::String: value_.emplace<3>(std::move(s)); break;
            case Type::Array: value_.emplace<4>(std::move(arr)); break;
            case Type::Vector3: value_.emplace<5>(v); break;
        }
    }

private:
    explicit StateValue(Storage value) : value_(std::move(value)) {}

    static constexpr uint8_t bit(Type t) { return static_cast<uint8_t>(1u << (static_cast<uint8_t>(t) - 1)); }

    Storage value_;
};

// Human readable rendering for logs and the console client
inline std::string describe(const StateValue& value) {
    std::ostringstream out;
    switch (value.type()) {
        case StateValue::Type::Bool: out << (value.as_bool() ? "true" : "false"); break;
        case StateValue::Type::Int: out << value.as_int(); break;
        case StateValue::Type::Float: out << value.as_float(); break;
        case StateValue::Type::String: out << '"' << value.as_string() << '"'; break;
        case StateValue::Type::Vector3: {
            const auto& v = value.as_vector3();
            out << '(' << v.x << ", " << v.y << ", " << v.z << ')';
            break;
        }
        case StateValue::Type::Array: {
            out << '[';
            const auto& arr = value.as_array();
            for (size_t n = 0; n < arr.size(); ++n) {
                if (n > 0) out << ", ";
                out << describe(arr[n]);
            }
            out << ']';
            break;
        }
    }
    return out.str();
}

} // namespace ghack::protocol
