// SOLSAFE - Stored Envelope Tests
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include <gtest/gtest.h>
#include "solsafe/core/json.h"
#include "solsafe/store/envelope.h"

#include <stdexcept>

using namespace solsafe;
using namespace solsafe::store;

TEST(StoredEnvelopeTest, SealIsIntact) {
    StoredEnvelope env = StoredEnvelope::Seal({1, 2, 3}, 1700000000);
    EXPECT_TRUE(env.IsIntact());
    EXPECT_EQ(env.writtenAt, 1700000000);
    EXPECT_EQ(env.checksum, StoredEnvelope::ComputeChecksum(env.payload));
}

TEST(StoredEnvelopeTest, EmptyPayload) {
    StoredEnvelope env = StoredEnvelope::Seal({}, 5);
    EXPECT_TRUE(env.IsIntact());
    StoredEnvelope parsed = StoredEnvelope::FromJSON(env.ToJSON());
    EXPECT_TRUE(parsed.payload.empty());
    EXPECT_TRUE(parsed.IsIntact());
}

TEST(StoredEnvelopeTest, JSONRoundTrip) {
    StoredEnvelope env = StoredEnvelope::Seal({0xDE, 0xAD, 0xBE, 0xEF}, 1234);
    std::string json = env.ToJSON();

    JSONValue doc = JSONValue::Parse(json);
    EXPECT_EQ(doc["payload"].GetString(), "deadbeef");
    EXPECT_EQ(doc["writtenAt"].GetInt(), 1234);
    EXPECT_EQ(doc["checksum"].GetString(), env.checksum.ToHex());

    StoredEnvelope parsed = StoredEnvelope::FromJSON(json);
    EXPECT_EQ(parsed.payload, env.payload);
    EXPECT_EQ(parsed.checksum, env.checksum);
    EXPECT_EQ(parsed.ToJSON(), json);
}

TEST(StoredEnvelopeTest, ChangedPayloadDetected) {
    StoredEnvelope env = StoredEnvelope::Seal({1, 2, 3, 4}, 0);
    env.payload[2] ^= 0x80;
    EXPECT_FALSE(env.IsIntact());

    env = StoredEnvelope::Seal({1, 2, 3, 4}, 0);
    env.payload.push_back(5);
    EXPECT_FALSE(env.IsIntact());
}

TEST(StoredEnvelopeTest, ChangedChecksumDetected) {
    StoredEnvelope env = StoredEnvelope::Seal({9, 9, 9}, 0);
    env.checksum[31] ^= 0x01;
    EXPECT_FALSE(env.IsIntact());
}

TEST(StoredEnvelopeTest, ParseDoesNotVerify) {
    StoredEnvelope env = StoredEnvelope::Seal({1, 2}, 0);
    JSONValue doc = JSONValue::Parse(env.ToJSON());
    doc["payload"] = JSONValue("0103");

    StoredEnvelope parsed = StoredEnvelope::FromJSON(doc.ToJSON());
    EXPECT_FALSE(parsed.IsIntact());
}

TEST(StoredEnvelopeTest, MalformedRejected) {
    EXPECT_THROW(StoredEnvelope::FromJSON(""), std::invalid_argument);
    EXPECT_THROW(StoredEnvelope::FromJSON("[1,2]"), std::invalid_argument);
    EXPECT_THROW(StoredEnvelope::FromJSON("{\"payload\":\"00\",\"writtenAt\":0}"),
                 std::invalid_argument);

    StoredEnvelope env = StoredEnvelope::Seal({1, 2}, 0);
    JSONValue doc = JSONValue::Parse(env.ToJSON());
    doc["payload"] = JSONValue("0g");
    EXPECT_THROW(StoredEnvelope::FromJSON(doc.ToJSON()), std::invalid_argument);

    doc = JSONValue::Parse(env.ToJSON());
    doc["checksum"] = JSONValue("00");
    EXPECT_THROW(StoredEnvelope::FromJSON(doc.ToJSON()), std::invalid_argument);

    doc = JSONValue::Parse(env.ToJSON());
    doc["writtenAt"] = JSONValue("yesterday");
    EXPECT_THROW(StoredEnvelope::FromJSON(doc.ToJSON()), std::invalid_argument);
}
