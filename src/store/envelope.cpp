// SOLSAFE - Stored Envelope Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/store/envelope.h"
#include "solsafe/core/hex.h"
#include "solsafe/core/json.h"
#include "solsafe/crypto/sha256.h"
#include "solsafe/crypto/tagged_hash.h"

#include <stdexcept>

namespace solsafe {
namespace store {

StoredEnvelope StoredEnvelope::Seal(Bytes payload, Timestamp writtenAt) {
    StoredEnvelope env;
    env.checksum = ComputeChecksum(payload);
    env.payload = std::move(payload);
    env.writtenAt = writtenAt;
    return env;
}

Hash256 StoredEnvelope::ComputeChecksum(ByteSpan payload) {
    return TaggedHash(DomainTag::CHECKSUM, {payload});
}

bool StoredEnvelope::IsIntact() const {
    return ConstantTimeEqual(ComputeChecksum(payload), checksum);
}

std::string StoredEnvelope::ToJSON() const {
    JSONValue::Object obj;
    obj["checksum"] = JSONValue(checksum.ToHex());
    obj["payload"] = JSONValue(BytesToHex(payload));
    obj["writtenAt"] = JSONValue(writtenAt);
    return JSONValue(std::move(obj)).ToJSON();
}

StoredEnvelope StoredEnvelope::FromJSON(const std::string& json) {
    JSONValue doc = JSONValue::Parse(json);
    if (!doc.IsObject()) {
        throw std::invalid_argument("envelope must be a JSON object");
    }

    StoredEnvelope env;
    env.checksum = Hash256::FromHex(doc.RequireString("checksum"));
    env.payload = HexToBytes(doc.RequireString("payload"));
    env.writtenAt = doc.RequireInt("writtenAt");
    return env;
}

} // namespace store
} // namespace solsafe
