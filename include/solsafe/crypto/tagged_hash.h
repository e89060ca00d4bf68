// SOLSAFE - Domain-Separated Hashing
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Every digest in SOLSAFE is SHA-256 over a UTF-8 domain tag followed by the
// input parts, concatenated in order with no length prefixes:
//
//   TaggedHash(tag, {a, b, c}) = SHA256(tag || a || b || c)
//
// The tag keeps a digest computed for one purpose from ever being accepted
// for another (a leaf digest is never a valid node digest, a commitment is
// never a valid nullifier).

#ifndef SOLSAFE_CRYPTO_TAGGED_HASH_H
#define SOLSAFE_CRYPTO_TAGGED_HASH_H

#include "solsafe/core/types.h"

#include <initializer_list>
#include <string>

namespace solsafe {

// ============================================================================
// Domain Tags
// ============================================================================

namespace DomainTag {
    /// Evidence item to Merkle leaf
    constexpr const char* LEAF = "LEAF:";
    /// Two child digests to Merkle parent
    constexpr const char* NODE = "NODE:";
    /// Vote byte and salt to vote commitment
    constexpr const char* COMMIT = "COMMIT:";
    /// Case id and commitment to nullifier
    constexpr const char* NULLIFIER = "NULLIFIER:";
    /// Serialized store payload to envelope checksum
    constexpr const char* CHECKSUM = "CHECKSUM:";
}

/// Hash parts under a domain tag.
/// Throws std::invalid_argument if the tag is empty.
Hash256 TaggedHash(const std::string& tag, std::initializer_list<ByteSpan> parts);

} // namespace solsafe

#endif // SOLSAFE_CRYPTO_TAGGED_HASH_H
