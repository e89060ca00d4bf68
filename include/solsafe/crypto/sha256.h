// SOLSAFE - SHA256 Hash Function
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP interface.

#ifndef SOLSAFE_CRYPTO_SHA256_H
#define SOLSAFE_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include "solsafe/core/types.h"

// From <openssl/evp.h>
struct evp_md_ctx_st;

namespace solsafe {

/// SHA-256 hasher.
/// Throws std::runtime_error if the OpenSSL digest context cannot be used.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    SHA256(SHA256&&) noexcept;
    SHA256& operator=(SHA256&&) noexcept;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(ByteSpan data) {
        return Write(data.data(), data.size());
    }

    /// Finalize into a caller buffer of OUTPUT_SIZE bytes.
    /// The hasher must be Reset() before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize and return the digest
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const Bytes& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Constant-time equality of two equal-length buffers (CRYPTO_memcmp)
bool ConstantTimeEqual(const Byte* a, const Byte* b, size_t len);

inline bool ConstantTimeEqual(const Hash256& a, const Hash256& b) {
    return ConstantTimeEqual(a.data(), b.data(), Hash256::SIZE);
}

} // namespace solsafe

#endif // SOLSAFE_CRYPTO_SHA256_H
