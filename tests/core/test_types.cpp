// ZKRANGE - Core Types Tests
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Tests for Hash256 and the hex helpers.

#include <gtest/gtest.h>
#include "zkrange/core/types.h"
#include "zkrange/core/hex.h"

#include <stdexcept>

namespace zkrange {
namespace test {

// ============================================================================
// Byte Type Tests
// ============================================================================

TEST(ByteTest, SizeIsOneByte) {
    EXPECT_EQ(sizeof(Byte), 1);
}

TEST(ByteTest, WordSizeIs32) {
    EXPECT_EQ(WORD_SIZE, 32u);
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32);
    Hash256 h;
    EXPECT_EQ(h.size(), 32);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }

    Hash256 h(data);
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(h[i], i);
    }
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, ShortInputIsZeroPadded) {
    Byte bytes[3] = {0xaa, 0xbb, 0xcc};
    Hash256 h(bytes, sizeof(bytes));
    EXPECT_EQ(h[0], 0xaa);
    EXPECT_EQ(h[2], 0xcc);
    EXPECT_EQ(h[3], 0);
    EXPECT_EQ(h[31], 0);
}

TEST(Hash256Test, EqualityAndOrdering) {
    std::array<Byte, 32> low{};
    std::array<Byte, 32> high{};
    high[0] = 1;

    Hash256 a(low), b(low), c(high);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < c);
    EXPECT_FALSE(c < a);
}

TEST(Hash256Test, SetNull) {
    std::array<Byte, 32> data;
    data.fill(0x11);
    Hash256 h(data);
    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(Hash256Test, HexIsDigestOrder) {
    std::array<Byte, 32> data{};
    data[0] = 0xde;
    data[1] = 0xad;
    data[31] = 0x01;
    Hash256 h(data);

    std::string hex = h.ToHex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 4), "dead");
    EXPECT_EQ(hex.substr(62), "01");
}

TEST(Hash256Test, FromHexRoundTrip) {
    const std::string hex =
        "290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h.ToHex(), hex);
    EXPECT_EQ(Hash256::FromHex("0x" + hex), h);
}

TEST(Hash256Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'g')), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(66, '0')), std::invalid_argument);
}

// ============================================================================
// Hex Helper Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<HexByte> bytes = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "000fa0ff");
    EXPECT_EQ(BytesToHex(std::vector<HexByte>{}), "");
}

TEST(HexTest, HexToBytes) {
    std::vector<HexByte> bytes = HexToBytes("00FFa0");
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(bytes[1], 0xff);
    EXPECT_EQ(bytes[2], 0xa0);
}

TEST(HexTest, HexToBytesRejectsOddLength) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(HexTest, HexToBytesRejectsBadCharacter) {
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00aaFF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0x00"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xabc"), "abc");
    EXPECT_EQ(StripHexPrefix("0Xabc"), "abc");
    EXPECT_EQ(StripHexPrefix("abc"), "abc");
    EXPECT_EQ(StripHexPrefix("0x"), "");
}

TEST(HexTest, TrimWhitespace) {
    EXPECT_EQ(TrimWhitespace("  ab \r\n"), "ab");
    EXPECT_EQ(TrimWhitespace("\t\t"), "");
    EXPECT_EQ(TrimWhitespace("a b"), "a b");
}

} // namespace test
} // namespace zkrange
