// SOLSAFE - Core Types and Hex Tests
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include <gtest/gtest.h>
#include "solsafe/core/hex.h"
#include "solsafe/core/random.h"
#include "solsafe/core/types.h"

#include <array>
#include <set>

using namespace solsafe;

// ============================================================================
// Hex Helpers
// ============================================================================

TEST(HexTest, EncodeLowercase) {
    Bytes data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
}

TEST(HexTest, DecodeAcceptsPrefixAndUppercase) {
    Bytes expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("0xDEADbeef"), expected);
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
}

TEST(HexTest, DecodeRejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("aabb", 3), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("0x00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("0g"));
}

// ============================================================================
// Hash256
// ============================================================================

TEST(Hash256Test, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.ToHex(), std::string(64, '0'));
}

TEST(Hash256Test, HexRoundTripKeepsByteOrder) {
    std::string hex = "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20";
    Hash256 h = Hash256::FromHex(hex);

    EXPECT_EQ(h[0], 0x01);
    EXPECT_EQ(h[31], 0x20);
    EXPECT_EQ(h.ToHex(), hex);
    EXPECT_EQ(h.ToShortHex(), "0102030405060708");
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("0102"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(66, 'a')), std::invalid_argument);
}

TEST(Hash256Test, Ordering) {
    Hash256 a = Hash256::FromHex(std::string(62, '0') + "01");
    Hash256 b = Hash256::FromHex(std::string(62, '0') + "02");
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
}

TEST(SpanTest, ViewsOverContainers) {
    Bytes vec = {1, 2, 3};
    ByteSpan s(vec);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s[2], 3);

    Hash256 h;
    ByteSpan hs(h);
    EXPECT_EQ(hs.size(), 32u);

    ByteSpan text = AsBytes("LEAF:");
    EXPECT_EQ(text.size(), 5u);
    EXPECT_EQ(text[0], 'L');
}

// ============================================================================
// Random
// ============================================================================

TEST(RandomTest, ArraysDiffer) {
    std::set<std::array<Byte, 32>> seen;
    for (int i = 0; i < 16; ++i) {
        seen.insert(GetRandArray<32>());
    }
    EXPECT_EQ(seen.size(), 16u);
}

TEST(RandomTest, FillsLargeBuffers) {
    Bytes buf(1024, 0);
    GetRandBytes(buf.data(), buf.size());

    size_t zeros = 0;
    for (Byte b : buf) {
        if (b == 0) ++zeros;
    }
    EXPECT_LT(zeros, 64u);
}
