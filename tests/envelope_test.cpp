#include "protocol/protocol.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>

using namespace ghack::protocol;

namespace {

Envelope reparse(const Envelope& envelope) {
    return Envelope::parse(envelope.serialize());
}

std::vector<Envelope> sample_messages() {
    std::vector<Envelope> samples;

    ConnectMsg connect;
    connect.version = 1;
    samples.emplace_back(connect);
    connect.version_str = "abc123";
    samples.emplace_back(connect);

    DisconnectMsg disconnect;
    disconnect.reason = DisconnectReason::Kicked;
    disconnect.reason_str = "bye";
    samples.emplace_back(disconnect);

    LoginMsg login;
    login.name = "alice";
    samples.emplace_back(login);
    login.authtoken = "secret";
    login.permissions = 7;
    samples.emplace_back(login);

    LoginResultMsg result;
    result.succeeded = false;
    result.reason = LoginReason::ServerFull;
    samples.emplace_back(result);

    AddEntityMsg add;
    add.id = -3;
    add.name = "goblin";
    samples.emplace_back(add);

    RemoveEntityMsg remove;
    remove.id = 7;
    samples.emplace_back(remove);

    UpdateStateMsg update;
    update.id = 7;
    update.state_id = "hp";
    update.value = StateValue::integer(30);
    samples.emplace_back(update);

    MoveMsg move;
    move.direction = Vector3(0.0, -1.0, 0.5);
    samples.emplace_back(move);

    AssignControlMsg control;
    control.uid = 7;
    control.revoked = true;
    samples.emplace_back(control);

    EntityDeathMsg death;
    death.uid = 7;
    death.killer_uid = 2;
    death.killer_name = "bob";
    samples.emplace_back(death);

    CombatHitMsg hit;
    hit.attacker_uid = 2;
    hit.victim_uid = 7;
    hit.victim_name = "goblin";
    hit.damage = 4.5f;
    samples.emplace_back(hit);

    return samples;
}

} // namespace

TEST(Envelope, ConnectMatchesReferenceBytes) {
    ConnectMsg connect;
    connect.version = 1;
    Envelope envelope(connect);

    EXPECT_EQ(envelope.type(), MessageType::Connect);
    EXPECT_EQ(envelope.serialize(), (std::vector<uint8_t>{0x08, 0x01, 0x82, 0x01, 0x02, 0x08, 0x01}));
}

TEST(Envelope, TypeFollowsPayload) {
    EXPECT_EQ(Envelope(MoveMsg{}).type(), MessageType::Move);
    EXPECT_EQ(Envelope(CombatHitMsg{}).type(), MessageType::CombatHit);
    EXPECT_EQ(Envelope(LoginResultMsg{}).type(), MessageType::LoginResult);
}

TEST(Envelope, EveryMessageTypeSurvivesTheWire) {
    for (const auto& envelope : sample_messages()) {
        SCOPED_TRACE(to_string(envelope.type()));
        EXPECT_EQ(reparse(envelope), envelope);
    }
}

TEST(Envelope, OptionalFieldsStayAbsent) {
    AddEntityMsg add;
    add.id = 9;
    Envelope decoded = reparse(add);
    ASSERT_TRUE(decoded.is<AddEntityMsg>());
    EXPECT_FALSE(decoded.get<AddEntityMsg>()->name.has_value());

    AssignControlMsg control;
    control.uid = 9;
    decoded = reparse(control);
    EXPECT_FALSE(decoded.get<AssignControlMsg>()->revoked.has_value());
    EXPECT_FALSE(decoded.get<AssignControlMsg>()->is_revoked());
}

TEST(Envelope, OnlyTheSelectedPayloadIsDecoded) {
    // type = AddEntity, a valid add_entity, plus a move payload full of junk
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::AddEntity);
    AddEntityMsg add;
    add.id = 5;
    w.write_message_field(2, add);
    w.write_tag(5, WireType::LengthDelimited);
    w.write_varint(3);
    w.write_u8(0xFF);
    w.write_u8(0xFF);
    w.write_u8(0xFF);

    Envelope decoded = Envelope::parse(buf);
    ASSERT_TRUE(decoded.is<AddEntityMsg>());
    EXPECT_EQ(decoded.get<AddEntityMsg>()->id, 5);
}

TEST(Envelope, UnknownFieldsAreSkipped) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::RemoveEntity);
    w.write_string_field(30, "from the future");
    RemoveEntityMsg remove;
    remove.id = 11;
    w.write_message_field(3, remove);

    Envelope decoded = Envelope::parse(buf);
    ASSERT_TRUE(decoded.is<RemoveEntityMsg>());
    EXPECT_EQ(decoded.get<RemoveEntityMsg>()->id, 11);
}

TEST(Envelope, LastOccurrenceWins) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::Connect);
    ConnectMsg first;
    first.version = 1;
    ConnectMsg second;
    second.version = 2;
    w.write_message_field(16, first);
    w.write_message_field(16, second);

    EXPECT_EQ(Envelope::parse(buf).get<ConnectMsg>()->version, 2u);
}

TEST(Envelope, MissingTypeIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    ConnectMsg connect;
    connect.version = 1;
    w.write_message_field(16, connect);

    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, MissingPayloadIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::Login);
    LoginMsg login;
    login.name = "alice";
    // Right payload, wrong slot
    w.write_message_field(16, login);

    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, UnknownDiscriminantIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_uint32_field(1, 12);
    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);

    buf.clear();
    w.write_uint32_field(1, 0);
    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, MissingRequiredPayloadFieldIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::UpdateState);
    w.write_tag(4, WireType::LengthDelimited);
    std::vector<uint8_t> inner;
    BufferWriter iw(inner);
    iw.write_int32_field(1, 7);
    iw.write_string_field(2, "hp");
    w.write_varint(inner.size());
    w.write_bytes(inner);

    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, UnknownReasonIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::Disconnect);
    w.write_tag(17, WireType::LengthDelimited);
    w.write_varint(2);
    w.write_u8(0x08);
    w.write_u8(0x09);  // reason = 9

    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, PayloadWithWrongWireTypeIsMalformed) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::Move);
    w.write_uint32_field(5, 1);

    EXPECT_THROW(Envelope::parse(buf), MalformedPayload);
}

TEST(Envelope, UnselectedPayloadWireTypeIsNotChecked) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::RemoveEntity);
    w.write_uint32_field(5, 1);  // move slot as a varint
    RemoveEntityMsg remove;
    remove.id = 4;
    w.write_message_field(3, remove);

    Envelope decoded = Envelope::parse(buf);
    ASSERT_TRUE(decoded.is<RemoveEntityMsg>());
    EXPECT_EQ(decoded.get<RemoveEntityMsg>()->id, 4);
}

TEST(Envelope, LaterWellFormedPayloadReplacesMisencodedOne) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_enum_field(1, MessageType::Connect);
    w.write_uint32_field(16, 1);
    ConnectMsg connect;
    connect.version = 3;
    w.write_message_field(16, connect);

    EXPECT_EQ(Envelope::parse(buf).get<ConnectMsg>()->version, 3u);
}

TEST(Envelope, DepthCeilingCoversThePayloadChain) {
    UpdateStateMsg update;
    update.id = 1;
    update.state_id = "pos";
    update.value = StateValue::vector3(Vector3(1.0, 2.0, 3.0));
    auto bytes = Envelope(update).serialize();

    // Envelope 0, UpdateState 1, StateValue 2, Vector3 3
    EXPECT_NO_THROW(Envelope::parse(bytes, 3));
    EXPECT_THROW(Envelope::parse(bytes, 2), MalformedPayload);
}
