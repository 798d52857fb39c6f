/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "test_helpers.h"

#include "wire/wire_byte_reader.h"
#include "wire/wire_byte_writer.h"
#include "wire/wire_text.h"

#include <stdexcept>
#include <string>

using namespace mptree::wire;
using mptree::test::bytes;
using mptree::test::catch_error;

TEST(HexBytes, FormatsUpperCaseWithPrefix) {
    EXPECT_EQ(to_hex_bytes(bytes({0x01, 0xAB, 0xFF})), "0x01ABFF");
    EXPECT_EQ(to_hex_bytes(bytes({})), "0x");
}

TEST(HexBytes, ParsesEitherCaseWithOrWithoutPrefix) {
    EXPECT_EQ(parse_hex_bytes("0x01abFF"), bytes({0x01, 0xAB, 0xFF}));
    EXPECT_EQ(parse_hex_bytes("0X00"), bytes({0x00}));
    EXPECT_EQ(parse_hex_bytes("dead"), bytes({0xDE, 0xAD}));
    EXPECT_EQ(parse_hex_bytes("0x"), bytes({}));
}

TEST(HexBytes, RejectsMalformed) {
    EXPECT_FALSE(parse_hex_bytes("0x123").has_value());
    EXPECT_FALSE(parse_hex_bytes("0xZZ").has_value());
    EXPECT_FALSE(parse_hex_bytes("0x 1").has_value());
}

TEST(Utf8, AcceptsWellFormed) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("h\xC3\xA9llo"));
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));
}

TEST(Utf8, RejectsIllFormed) {
    EXPECT_FALSE(is_valid_utf8("\xC3\x28"));
    EXPECT_FALSE(is_valid_utf8("\xC0\x80"));
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\xAF"));
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));
    EXPECT_FALSE(is_valid_utf8("\x80"));
    EXPECT_FALSE(is_valid_utf8("\xFF"));
}

TEST(ByteReader, ReadsBigEndian) {
    const auto buf = bytes({0x12, 0x34, 0x56, 0x78, 0x9A});
    ByteReader r(buf);
    EXPECT_EQ(r.read_u8("a"), 0x12);
    EXPECT_EQ(r.read_uint_be(2, "b"), 0x3456u);
    EXPECT_EQ(r.position(), 3u);
    EXPECT_EQ(r.remaining(), 2u);
    const auto rest = r.read_bytes(2, "c");
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0], 0x78);
    EXPECT_EQ(rest[1], 0x9A);
    EXPECT_TRUE(r.at_end());
}

TEST(ByteReader, ShortReadReportsOffset) {
    const auto buf = bytes({0xCB, 0x00, 0x00});
    ByteReader r(buf, 1);
    const auto err = catch_error([&] { (void)r.read_uint_be(8, "F64"); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code(), ErrorCode::UnexpectedEof);
    ASSERT_TRUE(err->offset().has_value());
    EXPECT_EQ(*err->offset(), 1u);
    EXPECT_EQ(r.position(), 1u);
}

TEST(ByteReader, CursorPastEndIsRejected) {
    const auto buf = bytes({0x00});
    EXPECT_THROW((void)ByteReader(buf, 2), std::invalid_argument);
    EXPECT_NO_THROW((void)ByteReader(buf, 1));
}

TEST(ByteWriter, WritesBigEndian) {
    ByteWriter w;
    w.write_u8(0xDC);
    w.write_uint_be(0x0102, 2);
    w.write_uint_be(0xFFFFFFFFu, 4);
    w.write_bytes(bytes({0xAA}));
    EXPECT_EQ(w.size(), 8u);
    EXPECT_EQ(w.take(), bytes({0xDC, 0x01, 0x02, 0xFF, 0xFF, 0xFF, 0xFF, 0xAA}));
    EXPECT_THROW(w.write_uint_be(1, 9), std::invalid_argument);
}

TEST(Error, MessagesCarryLocation) {
    const auto at_off = Error::at_offset(ErrorCode::TrailingData, 3, "2 byte(s) left");
    EXPECT_STREQ(at_off.what(), "TrailingData at offset 3: 2 byte(s) left");
    EXPECT_EQ(at_off.message(), "2 byte(s) left");

    const auto at_root = Error::at_path(ErrorCode::MalformedDocument, "", "bad");
    EXPECT_STREQ(at_root.what(), "MalformedDocument at /: bad");
    EXPECT_FALSE(at_root.offset().has_value());

    const auto nested = Error::at_path(ErrorCode::ValueOutOfRange, "/data/value/1", "too big");
    EXPECT_EQ(nested.path(), "/data/value/1");
    EXPECT_STREQ(nested.what(), "ValueOutOfRange at /data/value/1: too big");
}
