#include "common/handshake.hpp"
#include <gtest/gtest.h>

using namespace ghack;
using ghack::protocol::MessageType;

TEST(Handshake, InitialPhaseDependsOnRole) {
    EXPECT_EQ(initial_phase(Role::Server), HandshakePhase::AwaitingConnect);
    EXPECT_EQ(initial_phase(Role::Client), HandshakePhase::AwaitingConnectAck);
    EXPECT_EQ(Handshake(Role::Server).phase(), HandshakePhase::AwaitingConnect);
}

TEST(Handshake, ServerHappyPath) {
    Handshake hs(Role::Server);
    EXPECT_TRUE(hs.advance(HandshakeEvent::ConnectAccepted));
    EXPECT_EQ(hs.phase(), HandshakePhase::AwaitingLogin);
    EXPECT_TRUE(hs.advance(HandshakeEvent::LoginAccepted));
    EXPECT_TRUE(hs.is_established());
    EXPECT_TRUE(hs.advance(HandshakeEvent::Disconnected));
    EXPECT_TRUE(hs.is_closed());
}

TEST(Handshake, ClientHappyPath) {
    Handshake hs(Role::Client);
    EXPECT_TRUE(hs.advance(HandshakeEvent::ConnectAccepted));
    EXPECT_EQ(hs.phase(), HandshakePhase::AwaitingLogin);
    EXPECT_TRUE(hs.advance(HandshakeEvent::LoginSent));
    EXPECT_EQ(hs.phase(), HandshakePhase::AwaitingLoginResult);
    EXPECT_TRUE(hs.advance(HandshakeEvent::LoginAccepted));
    EXPECT_TRUE(hs.is_established());
}

TEST(Handshake, RejectionsClose) {
    EXPECT_EQ(next_phase(Role::Server, HandshakePhase::AwaitingConnect, HandshakeEvent::ConnectRejected),
              HandshakePhase::Closed);
    EXPECT_EQ(next_phase(Role::Server, HandshakePhase::AwaitingLogin, HandshakeEvent::LoginRejected),
              HandshakePhase::Closed);
    EXPECT_EQ(next_phase(Role::Client, HandshakePhase::AwaitingLoginResult, HandshakeEvent::LoginRejected),
              HandshakePhase::Closed);
}

TEST(Handshake, DisconnectClosesFromAnyOpenPhase) {
    for (auto phase : {HandshakePhase::AwaitingConnect, HandshakePhase::AwaitingConnectAck,
                       HandshakePhase::AwaitingLogin, HandshakePhase::AwaitingLoginResult,
                       HandshakePhase::Established}) {
        SCOPED_TRACE(to_string(phase));
        EXPECT_EQ(next_phase(Role::Client, phase, HandshakeEvent::Disconnected), HandshakePhase::Closed);
        EXPECT_EQ(next_phase(Role::Server, phase, HandshakeEvent::Disconnected), HandshakePhase::Closed);
    }
}

TEST(Handshake, ClosedIsTerminal) {
    Handshake hs(Role::Server);
    hs.advance(HandshakeEvent::Disconnected);
    EXPECT_FALSE(hs.advance(HandshakeEvent::ConnectAccepted));
    EXPECT_FALSE(hs.advance(HandshakeEvent::Disconnected));
    EXPECT_TRUE(hs.is_closed());
    EXPECT_FALSE(hs.accepts(MessageType::Disconnect));
}

TEST(Handshake, IllegalEventsLeavePhaseAlone) {
    Handshake server(Role::Server);
    EXPECT_FALSE(server.advance(HandshakeEvent::LoginAccepted));
    EXPECT_FALSE(server.advance(HandshakeEvent::LoginSent));
    EXPECT_EQ(server.phase(), HandshakePhase::AwaitingConnect);

    Handshake client(Role::Client);
    EXPECT_FALSE(client.advance(HandshakeEvent::LoginAccepted));
    client.advance(HandshakeEvent::ConnectAccepted);
    EXPECT_FALSE(client.advance(HandshakeEvent::LoginAccepted));
    EXPECT_EQ(client.phase(), HandshakePhase::AwaitingLogin);

    Handshake established(Role::Server);
    established.advance(HandshakeEvent::ConnectAccepted);
    established.advance(HandshakeEvent::LoginAccepted);
    EXPECT_FALSE(established.advance(HandshakeEvent::ConnectAccepted));
    EXPECT_TRUE(established.is_established());
}

TEST(Handshake, InboundGatingBeforeEstablished) {
    EXPECT_TRUE(accepts_inbound(Role::Server, HandshakePhase::AwaitingConnect, MessageType::Connect));
    EXPECT_FALSE(accepts_inbound(Role::Server, HandshakePhase::AwaitingConnect, MessageType::Login));
    EXPECT_FALSE(accepts_inbound(Role::Server, HandshakePhase::AwaitingConnect, MessageType::Move));
    EXPECT_TRUE(accepts_inbound(Role::Server, HandshakePhase::AwaitingLogin, MessageType::Login));
    EXPECT_FALSE(accepts_inbound(Role::Server, HandshakePhase::AwaitingLogin, MessageType::Connect));
    EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::AwaitingConnectAck, MessageType::Connect));
    EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::AwaitingLoginResult, MessageType::LoginResult));
    EXPECT_FALSE(accepts_inbound(Role::Client, HandshakePhase::AwaitingLoginResult, MessageType::AddEntity));
}

TEST(Handshake, DisconnectAcceptedWhileOpen) {
    EXPECT_TRUE(accepts_inbound(Role::Server, HandshakePhase::AwaitingConnect, MessageType::Disconnect));
    EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::AwaitingLoginResult, MessageType::Disconnect));
    EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::Established, MessageType::Disconnect));
}

TEST(Handshake, EstablishedTrafficRespectsDirection) {
    EXPECT_TRUE(accepts_inbound(Role::Server, HandshakePhase::Established, MessageType::Move));
    EXPECT_FALSE(accepts_inbound(Role::Client, HandshakePhase::Established, MessageType::Move));
    EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::Established, MessageType::AssignControl));
    EXPECT_FALSE(accepts_inbound(Role::Server, HandshakePhase::Established, MessageType::AssignControl));

    for (auto type : {MessageType::AddEntity, MessageType::RemoveEntity, MessageType::UpdateState,
                      MessageType::EntityDeath, MessageType::CombatHit}) {
        EXPECT_TRUE(accepts_inbound(Role::Client, HandshakePhase::Established, type));
        EXPECT_TRUE(accepts_inbound(Role::Server, HandshakePhase::Established, type));
    }

    EXPECT_FALSE(accepts_inbound(Role::Server, HandshakePhase::Established, MessageType::Connect));
    EXPECT_FALSE(accepts_inbound(Role::Client, HandshakePhase::Established, MessageType::LoginResult));
}
