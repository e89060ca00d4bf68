// SOLSAFE - Stored Envelope
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Tamper-evidence wrapper for persisted secrets:
//
//   {"checksum": hex, "payload": hex, "writtenAt": unix-seconds}
//
// checksum = H("CHECKSUM:" || payload). It detects corruption and casual
// edits; anyone able to rewrite the payload can also rewrite the checksum.

#ifndef SOLSAFE_STORE_ENVELOPE_H
#define SOLSAFE_STORE_ENVELOPE_H

#include "solsafe/core/types.h"

#include <string>

namespace solsafe {
namespace store {

struct StoredEnvelope {
    Bytes payload;
    Hash256 checksum;
    Timestamp writtenAt{0};

    /// Wrap payload with a fresh checksum
    static StoredEnvelope Seal(Bytes payload, Timestamp writtenAt = GetTime());

    /// H("CHECKSUM:" || payload)
    static Hash256 ComputeChecksum(ByteSpan payload);

    /// Recompute the checksum over payload and compare
    bool IsIntact() const;

    /// Canonical JSON text
    std::string ToJSON() const;

    /// Parse envelope JSON. Does not check the checksum.
    /// Throws std::invalid_argument if the text is not a well-formed envelope.
    static StoredEnvelope FromJSON(const std::string& json);
};

} // namespace store
} // namespace solsafe

#endif // SOLSAFE_STORE_ENVELOPE_H
