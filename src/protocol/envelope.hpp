#pragma once

#include "protocol/add_entity_msg.hpp"
#include "protocol/assign_control_msg.hpp"
#include "protocol/combat_hit_msg.hpp"
#include "protocol/connect_msg.hpp"
#include "protocol/disconnect_msg.hpp"
#include "protocol/entity_death_msg.hpp"
#include "protocol/login_msg.hpp"
#include "protocol/login_result_msg.hpp"
#include "protocol/move_msg.hpp"
#include "protocol/remove_entity_msg.hpp"
#include "protocol/update_state_msg.hpp"
#include <array>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ghack::protocol {

// Alternative order follows MessageType: index + 1 == wire discriminant
using Payload = std::variant<ConnectMsg, DisconnectMsg, LoginMsg, LoginResultMsg,
                             AddEntityMsg, RemoveEntityMsg, UpdateStateMsg, MoveMsg,
                             AssignControlMsg, EntityDeathMsg, CombatHitMsg>;

template<typename T, typename V>
struct is_alternative_of;

template<typename T, typename... Ts>
struct is_alternative_of<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

template<typename T>
inline constexpr bool is_payload_v = is_alternative_of<T, Payload>::value;

// Unit of transmission: a type plus exactly one payload. The payload is the
// discriminant, so the type can never disagree with it.
struct Envelope {
    Payload payload;

    Envelope() = default;

    template<typename Msg, typename = std::enable_if_t<is_payload_v<std::decay_t<Msg>>>>
    Envelope(Msg&& msg) : payload(std::forward<Msg>(msg)) {}

    MessageType type() const { return static_cast<MessageType>(payload.index() + 1); }

    template<typename Msg>
    const Msg* get() const { return std::get_if<Msg>(&payload); }

    template<typename Msg>
    bool is() const { return std::holds_alternative<Msg>(payload); }

    bool operator==(const Envelope&) const = default;

    void serialize(BufferWriter& w) const {
        w.write_enum_field(1, type());
        std::visit([&w](const auto& msg) {
            w.write_message_field(std::decay_t<decltype(msg)>::ENVELOPE_FIELD, msg);
        }, payload);
    }

    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buf;
        BufferWriter w(buf);
        serialize(w);
        return buf;
    }

    // Payloads other than the one selected by type are skipped unparsed
    static Envelope parse(std::span<const uint8_t> data,
                          size_t max_depth = BufferReader::DEFAULT_MAX_DEPTH) {
        BufferReader r(data, max_depth);
        std::optional<MessageType> type;
        PayloadFields fields;

        while (!r.at_end()) {
            FieldTag tag = r.read_tag();
            if (tag.field == 1) {
                BufferReader::expect(tag, WireType::Varint);
                type = message_type_from_wire(r.read_varint());
            } else if (is_payload_field(tag.field) && tag.type == WireType::LengthDelimited) {
                fields.bytes[tag.field] = r.read_length_delimited();
                fields.misencoded[tag.field] = false;
            } else if (is_payload_field(tag.field)) {
                // Only an error if type selects this field
                r.skip_field(tag);
                fields.bytes[tag.field].reset();
                fields.misencoded[tag.field] = true;
            } else {
                r.skip_field(tag);
            }
        }

        require_field(type.has_value(), "Envelope", "type");
        return decode_payload(*type, r, fields);
    }

private:
    static constexpr uint32_t MAX_PAYLOAD_FIELD = 22;

    struct PayloadFields {
        std::array<std::optional<std::span<const uint8_t>>, MAX_PAYLOAD_FIELD + 1> bytes;
        std::array<bool, MAX_PAYLOAD_FIELD + 1> misencoded{};
    };

    // Frequent messages use fields 2-5, handshake and rare ones 16-22
    static constexpr bool is_payload_field(uint32_t field) {
        return (field >= 2 && field <= 5) || (field >= 16 && field <= MAX_PAYLOAD_FIELD);
    }

    template<typename Msg>
    static Envelope decode_as(const BufferReader& r, const PayloadFields& fields) {
        if (fields.misencoded[Msg::ENVELOPE_FIELD]) {
            throw MalformedPayload(std::string("Envelope: ") + to_string(Msg::TYPE) +
                                   " payload is not length-delimited");
        }
        const auto& bytes = fields.bytes[Msg::ENVELOPE_FIELD];
        if (!bytes) {
            throw MalformedPayload(std::string("Envelope: ") + to_string(Msg::TYPE) +
                                   " without its payload");
        }
        BufferReader sub = r.child(*bytes);
        Msg msg;
        msg.deserialize(sub);
        return Envelope(std::move(msg));
    }

    static Envelope decode_payload(MessageType type, const BufferReader& r, const PayloadFields& fields) {
        switch (type) {
            case MessageType::Connect: return decode_as<ConnectMsg>(r, fields);
            case MessageType::Disconnect: return decode_as<DisconnectMsg>(r, fields);
            case MessageType::Login: return decode_as<LoginMsg>(r, fields);
            case MessageType::LoginResult: return decode_as<LoginResultMsg>(r, fields);
            case MessageType::AddEntity: return decode_as<AddEntityMsg>(r, fields);
            case MessageType::RemoveEntity: return decode_as<RemoveEntityMsg>(r, fields);
            case MessageType::UpdateState: return decode_as<UpdateStateMsg>(r, fields);
            case MessageType::Move: return decode_as<MoveMsg>(r, fields);
            case MessageType::AssignControl: return decode_as<AssignControlMsg>(r, fields);
            case MessageType::EntityDeath: return decode_as<EntityDeathMsg>(r, fields);
            case MessageType::CombatHit: return decode_as<CombatHitMsg>(r, fields);
        }
        throw MalformedPayload("Envelope: unhandled message type");
    }
};

} // namespace ghack::protocol
