#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/errors.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

using namespace ghack::protocol;

TEST(BufferWriter, VarintUsesSevenBitGroups) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_varint(1);
    w.write_varint(300);
    EXPECT_EQ(buf, (std::vector<uint8_t>{0x01, 0xAC, 0x02}));
}

TEST(BufferWriter, LengthPrefixIsBigEndian) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_u16_be(0x1234);
    EXPECT_EQ(buf, (std::vector<uint8_t>{0x12, 0x34}));

    BufferReader r(buf);
    EXPECT_EQ(r.read_u16_be(), 0x1234);
    EXPECT_TRUE(r.at_end());
}

TEST(BufferWriter, NegativeInt32IsSignExtended) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_int32_field(3, -2);
    // One tag byte plus a ten byte varint
    ASSERT_EQ(buf.size(), 11u);

    BufferReader r(buf);
    FieldTag tag = r.read_tag();
    EXPECT_EQ(tag.field, 3u);
    EXPECT_EQ(tag.type, WireType::Varint);
    EXPECT_EQ(r.read_int32(), -2);
}

TEST(BufferWriter, FieldTagsCarryNumberAndWireType) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_string_field(16, "ab");
    EXPECT_EQ(buf, (std::vector<uint8_t>{0x82, 0x01, 0x02, 'a', 'b'}));
}

TEST(BufferReader, ScalarsReadBack) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_uint32_field(1, 4000000000u);
    w.write_bool_field(2, true);
    w.write_float_field(3, 1.5f);
    w.write_double_field(4, -0.25);
    w.write_string_field(5, "hello");

    BufferReader r(buf);
    r.read_tag();
    EXPECT_EQ(r.read_uint32(), 4000000000u);
    r.read_tag();
    EXPECT_TRUE(r.read_bool());
    r.read_tag();
    EXPECT_FLOAT_EQ(r.read_float(), 1.5f);
    r.read_tag();
    EXPECT_DOUBLE_EQ(r.read_double(), -0.25);
    r.read_tag();
    EXPECT_EQ(r.read_string(), "hello");
    EXPECT_TRUE(r.at_end());
}

TEST(BufferReader, TruncatedInputThrows) {
    std::vector<uint8_t> buf = {0x80, 0x80};
    BufferReader r(buf);
    EXPECT_THROW(r.read_varint(), MalformedPayload);

    std::vector<uint8_t> fixed = {0x01, 0x02, 0x03};
    BufferReader r2(fixed);
    EXPECT_THROW(r2.read_fixed32(), MalformedPayload);
}

TEST(BufferReader, OverlongVarintThrows) {
    std::vector<uint8_t> buf(11, 0xFF);
    buf.push_back(0x01);
    BufferReader r(buf);
    EXPECT_THROW(r.read_varint(), MalformedPayload);
}

TEST(BufferReader, LengthPastEndThrows) {
    std::vector<uint8_t> buf = {0x0A, 0x05, 'a', 'b'};
    BufferReader r(buf);
    r.read_tag();
    EXPECT_THROW(r.read_string(), MalformedPayload);
}

TEST(BufferReader, RejectsFieldZeroAndGroups) {
    std::vector<uint8_t> field_zero = {0x00};
    BufferReader r1(field_zero);
    EXPECT_THROW(r1.read_tag(), MalformedPayload);

    std::vector<uint8_t> start_group = {0x0B};  // field 1, wire type 3
    BufferReader r2(start_group);
    EXPECT_THROW(r2.read_tag(), MalformedPayload);

    std::vector<uint8_t> bad_type = {0x0E};  // field 1, wire type 6
    BufferReader r3(bad_type);
    EXPECT_THROW(r3.read_tag(), MalformedPayload);
}

TEST(BufferReader, SkipsUnknownFields) {
    std::vector<uint8_t> buf;
    BufferWriter w(buf);
    w.write_uint32_field(7, 99);
    w.write_double_field(8, 2.0);
    w.write_string_field(9, "skip me");
    w.write_float_field(10, 3.0f);
    w.write_uint32_field(1, 42);

    BufferReader r(buf);
    for (int i = 0; i < 4; ++i) {
        r.skip_field(r.read_tag());
    }
    FieldTag tag = r.read_tag();
    EXPECT_EQ(tag.field, 1u);
    EXPECT_EQ(r.read_uint32(), 42u);
}

TEST(BufferReader, ExpectRejectsWrongWireType) {
    FieldTag tag{1, WireType::Fixed32};
    EXPECT_THROW(BufferReader::expect(tag, WireType::Varint), MalformedPayload);
    EXPECT_NO_THROW(BufferReader::expect(tag, WireType::Fixed32));
}

TEST(BufferReader, ChildReadersCountDepth) {
    std::vector<uint8_t> buf = {0x01};
    BufferReader root(buf, 2);
    EXPECT_EQ(root.depth(), 0u);

    BufferReader level1 = root.child(buf);
    BufferReader level2 = level1.child(buf);
    EXPECT_EQ(level2.depth(), 2u);
    EXPECT_THROW(level2.child(buf), MalformedPayload);
}
