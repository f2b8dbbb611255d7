#include "protocol/protocol.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

using namespace ghack::protocol;

namespace {

Envelope add_entity_named(size_t name_length) {
    AddEntityMsg add;
    add.id = 1;
    add.name = std::string(name_length, 'x');
    return Envelope(add);
}

std::vector<Envelope> conversation() {
    ConnectMsg connect;
    connect.version = 1;
    LoginMsg login;
    login.name = "alice";
    LoginResultMsg result;
    result.succeeded = true;
    AddEntityMsg add;
    add.id = 7;
    add.name = "goblin";
    UpdateStateMsg update;
    update.id = 7;
    update.state_id = "hp";
    update.value = StateValue::integer(30);
    return {connect, login, result, add, update};
}

} // namespace

TEST(Frame, PrefixesPayloadWithBigEndianLength) {
    ConnectMsg connect;
    connect.version = 1;
    EXPECT_EQ(build_frame(connect),
              (std::vector<uint8_t>{0x00, 0x07, 0x08, 0x01, 0x82, 0x01, 0x02, 0x08, 0x01}));
}

TEST(Frame, DecodeReportsConsumedBytes) {
    auto frame = build_frame(add_entity_named(3));
    frame.push_back(0x00);  // start of the next frame

    auto decoded = decode_frame(frame);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->consumed, frame.size() - 1);
    EXPECT_EQ(decoded->envelope, add_entity_named(3));
}

TEST(Frame, IncompleteUntilWholeFrameArrives) {
    auto frame = build_frame(add_entity_named(10));
    std::span<const uint8_t> bytes(frame);

    EXPECT_FALSE(decode_frame(bytes.first(0)).has_value());
    EXPECT_FALSE(decode_frame(bytes.first(1)).has_value());
    EXPECT_FALSE(decode_frame(bytes.first(frame.size() - 1)).has_value());
    EXPECT_TRUE(decode_frame(bytes).has_value());
}

TEST(Frame, LargestPayloadFits) {
    // Varint widths are stable over this range, so size grows one for one
    const size_t sample = 20000;
    const size_t base = add_entity_named(sample).serialize().size();
    const size_t fits = sample + (MAX_FRAME_PAYLOAD - base);

    Envelope largest = add_entity_named(fits);
    ASSERT_EQ(largest.serialize().size(), 65535u);

    auto frame = build_frame(largest);
    EXPECT_EQ(frame.size(), 65537u);
    EXPECT_EQ(frame[0], 0xFF);
    EXPECT_EQ(frame[1], 0xFF);

    auto decoded = decode_frame(frame);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->envelope, largest);

    Envelope too_large = add_entity_named(fits + 1);
    ASSERT_EQ(too_large.serialize().size(), 65536u);
    try {
        build_frame(too_large);
        FAIL() << "expected PayloadTooLarge";
    } catch (const PayloadTooLarge& e) {
        EXPECT_EQ(e.size(), 65536u);
    }
}

TEST(Frame, EmptyPayloadIsMalformed) {
    std::vector<uint8_t> frame = {0x00, 0x00};
    EXPECT_THROW(decode_frame(frame), MalformedPayload);
}

TEST(FrameDecoder, ByteAtATimeMatchesBulk) {
    std::vector<uint8_t> stream;
    for (const auto& envelope : conversation()) {
        auto frame = build_frame(envelope);
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    FrameDecoder bulk;
    bulk.feed(stream);
    std::vector<Envelope> expected;
    while (auto envelope = bulk.next()) {
        expected.push_back(*envelope);
    }
    ASSERT_EQ(expected, conversation());

    FrameDecoder trickle;
    std::vector<Envelope> received;
    for (uint8_t byte : stream) {
        trickle.feed(std::span<const uint8_t>(&byte, 1));
        while (auto envelope = trickle.next()) {
            received.push_back(*envelope);
        }
    }
    EXPECT_EQ(received, expected);
    EXPECT_EQ(trickle.buffered(), 0u);
}

TEST(FrameDecoder, KeepsPartialFrameBuffered) {
    auto frame = build_frame(add_entity_named(4));
    FrameDecoder decoder;
    decoder.feed(std::span<const uint8_t>(frame).first(3));
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.buffered(), 3u);

    decoder.feed(std::span<const uint8_t>(frame).subspan(3));
    auto envelope = decoder.next();
    ASSERT_TRUE(envelope.has_value());
    EXPECT_EQ(*envelope, add_entity_named(4));
    EXPECT_FALSE(decoder.next().has_value());
}

TEST(FrameDecoder, MalformedFrameThrows) {
    std::vector<uint8_t> frame = {0x00, 0x02, 0x08, 0x63};  // type = 99
    FrameDecoder decoder;
    decoder.feed(frame);
    EXPECT_THROW(decoder.next(), MalformedPayload);
}

TEST(FrameDecoder, HonoursDepthCeiling) {
    UpdateStateMsg update;
    update.id = 1;
    update.state_id = "nested";
    update.value = StateValue::array({StateValue::array({StateValue::integer(1)})});
    auto frame = build_frame(update);

    FrameDecoder strict(3);
    strict.feed(frame);
    EXPECT_THROW(strict.next(), MalformedPayload);

    FrameDecoder relaxed(4);
    relaxed.feed(frame);
    EXPECT_TRUE(relaxed.next().has_value());
}
