// SOLSAFE - Serialization Tests
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include <gtest/gtest.h>
#include "solsafe/core/hex.h"
#include "solsafe/core/serialize.h"
#include "solsafe/core/types.h"

#include <array>
#include <string>

using namespace solsafe;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    Bytes data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());

    EXPECT_EQ(ds.size(), 4u);

    Bytes result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.Data().size(), 4u);
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ds << uint8_t(7);

    uint64_t value = 0;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, ReadsFromGivenBuffer) {
    DataStream ds(Bytes{0x2A, 0, 0, 0, 0, 0, 0, 0, 0x01});
    uint64_t value = 0;
    bool flag = false;
    ds >> value >> flag;
    EXPECT_EQ(value, 42u);
    EXPECT_TRUE(flag);
    EXPECT_TRUE(ds.empty());
}

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ds;
    ds << uint8_t(0x09);
    ds << uint64_t(0x0102030405060708ULL);

    EXPECT_EQ(BytesToHex(ds.Data()), "09" "0807060504030201");
}

TEST(SerializeTest, EncodeLE64) {
    auto bytes = EncodeLE64(42);
    std::array<Byte, 8> expected = {42, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(bytes, expected);

    auto max = EncodeLE64(0xFFFFFFFFFFFFFFFFULL);
    for (Byte b : max) {
        EXPECT_EQ(b, 0xFF);
    }
}

TEST(SerializeTest, DecodeInvertsEncode) {
    for (uint64_t v : {0ULL, 1ULL, 255ULL, 256ULL, 0x8000000000000000ULL, 0x0123456789ABCDEFULL}) {
        EXPECT_EQ(DecodeLE<uint64_t>(EncodeLE<uint64_t>(v)), v);
    }
    EXPECT_EQ(DecodeLE<uint16_t>(std::array<Byte, 2>{0x34, 0x12}), 0x1234);
}

// ============================================================================
// Booleans
// ============================================================================

TEST(SerializeTest, BoolIsOneByte) {
    DataStream ds;
    ds << true << false;
    EXPECT_EQ(BytesToHex(ds.Data()), "0100");
}

TEST(SerializeTest, NonCanonicalBoolRejected) {
    DataStream ds;
    ds << uint8_t(2);

    bool out = false;
    EXPECT_THROW(ds >> out, std::ios_base::failure);
}

// ============================================================================
// Fixed Arrays and Digests
// ============================================================================

TEST(SerializeTest, FixedArrayHasNoPrefix) {
    DataStream ds;
    std::array<Byte, 4> arr = {1, 2, 3, 4};
    ds << arr;
    EXPECT_EQ(ds.size(), 4u);

    std::array<Byte, 4> out{};
    ds >> out;
    EXPECT_EQ(out, arr);
}

TEST(SerializeTest, Hash256IsRaw32Bytes) {
    Hash256 h = Hash256::FromHex(std::string(64, 'a'));
    DataStream ds;
    ds << h;
    EXPECT_EQ(ds.size(), 32u);

    Hash256 out;
    ds >> out;
    EXPECT_EQ(out, h);
}

TEST(SerializeTest, TruncatedDigestThrows) {
    DataStream ds(Bytes(31, 0xAB));
    Hash256 out;
    EXPECT_THROW(ds >> out, std::ios_base::failure);
}
