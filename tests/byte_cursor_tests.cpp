#include "../src/byte_cursor.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <vector>

using psyq::ByteCursor;
using psyq::ErrorKind;
using psyq::ParseError;

namespace {
void expect_truncated(const std::function<void()>& read, size_t offset) {
    try {
        read();
        ADD_FAILURE() << "Expected TruncatedInput";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.offset(), offset);
    }
}
} // namespace

TEST(ByteCursorTests, ReadsLittleEndianValues) {
    const std::vector<uint8_t> data = {0xAB, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12};
    ByteCursor cursor(data);

    EXPECT_EQ(cursor.read_u8(), 0xAB);
    EXPECT_EQ(cursor.read_u16_le(), 0x1234);
    EXPECT_EQ(cursor.read_u32_le(), 0x12345678u);
    EXPECT_TRUE(cursor.is_eof());
    EXPECT_EQ(cursor.position(), data.size());
}

TEST(ByteCursorTests, ReadBytesReturnsViewAndAdvances) {
    const std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    ByteCursor cursor(data);
    cursor.skip(1);

    auto bytes = cursor.read_bytes(3);
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[0], 2);
    EXPECT_EQ(bytes[2], 4);
    EXPECT_EQ(bytes.data(), data.data() + 1) << "read_bytes should not copy";
    EXPECT_EQ(cursor.remaining(), 1u);
}

TEST(ByteCursorTests, LengthPrefixedName) {
    const std::vector<uint8_t> data = {5, '.', 't', 'e', 'x', 't', 0xFF};
    ByteCursor cursor(data);

    EXPECT_EQ(cursor.read_length_prefixed_bytes(), ".text");
    EXPECT_EQ(cursor.position(), 6u);
}

TEST(ByteCursorTests, EmptyLengthPrefixedName) {
    const std::vector<uint8_t> data = {0};
    ByteCursor cursor(data);

    EXPECT_EQ(cursor.read_length_prefixed_bytes(), "");
    EXPECT_TRUE(cursor.is_eof());
}

TEST(ByteCursorTests, NamesKeepRawBytes) {
    const std::vector<uint8_t> data = {3, 0x00, 0xFF, 0x80};
    ByteCursor cursor(data);

    auto name = cursor.read_length_prefixed_bytes();
    ASSERT_EQ(name.size(), 3u);
    EXPECT_EQ(static_cast<uint8_t>(name[0]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(name[1]), 0xFF);
    EXPECT_EQ(static_cast<uint8_t>(name[2]), 0x80);
}

TEST(ByteCursorTests, TruncatedReadsThrowAndKeepPosition) {
    const std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    ByteCursor cursor(data);
    cursor.skip(2);

    expect_truncated([&] { cursor.read_u16_le(); }, 2);
    EXPECT_EQ(cursor.position(), 2u);

    expect_truncated([&] { cursor.read_u32_le(); }, 2);
    expect_truncated([&] { cursor.read_bytes(2); }, 2);
    expect_truncated([&] { cursor.skip(5); }, 2);
    EXPECT_EQ(cursor.position(), 2u);

    EXPECT_EQ(cursor.read_u8(), 0x03);
    expect_truncated([&] { cursor.read_u8(); }, 3);
}

TEST(ByteCursorTests, TruncatedNameRewindsToLengthByte) {
    const std::vector<uint8_t> data = {0xAA, 10, 'a', 'b'};
    ByteCursor cursor(data);
    cursor.skip(1);

    expect_truncated([&] { cursor.read_length_prefixed_bytes(); }, 1);
    EXPECT_EQ(cursor.position(), 1u);
}

TEST(ByteCursorTests, SeekIsBoundsChecked) {
    const std::vector<uint8_t> data = {1, 2, 3};
    ByteCursor cursor(data);

    cursor.seek(3);
    EXPECT_TRUE(cursor.is_eof());
    cursor.seek(0);
    EXPECT_EQ(cursor.read_u8(), 1);

    expect_truncated([&] { cursor.seek(4); }, 1);
}

TEST(ByteCursorTests, EmptyBuffer) {
    const std::vector<uint8_t> data;
    ByteCursor cursor(data);

    EXPECT_TRUE(cursor.is_eof());
    EXPECT_EQ(cursor.size(), 0u);
    expect_truncated([&] { cursor.read_u8(); }, 0);
}
