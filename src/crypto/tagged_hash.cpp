// SOLSAFE - Domain-Separated Hashing Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/crypto/tagged_hash.h"
#include "solsafe/crypto/sha256.h"

#include <stdexcept>

namespace solsafe {

Hash256 TaggedHash(const std::string& tag, std::initializer_list<ByteSpan> parts) {
    if (tag.empty()) {
        throw std::invalid_argument("TaggedHash: domain tag must not be empty");
    }

    SHA256 hasher;
    hasher.Write(AsBytes(tag));
    for (const ByteSpan& part : parts) {
        hasher.Write(part);
    }
    return hasher.Finalize();
}

} // namespace solsafe
