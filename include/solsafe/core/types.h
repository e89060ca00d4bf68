// SOLSAFE - Core Types Header
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Byte, digest and identifier types shared by the evidence, vote and store
// layers.

#ifndef SOLSAFE_CORE_TYPES_H
#define SOLSAFE_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace solsafe {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;

/// Unix epoch seconds
using Timestamp = int64_t;

/// On-chain dispute case identifier. Zero is never a valid case.
using CaseId = uint64_t;

/// Owned byte sequence (evidence items, serialized payloads)
using Bytes = std::vector<Byte>;

inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash256
// ============================================================================

/**
 * 32-byte digest: evidence leaves and roots, vote commitments, nullifiers and
 * store checksums.
 *
 * Bytes are held in the order the hash function produced them and ToHex()
 * prints them in that same order, which is also how they travel on-chain.
 */
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    /// All-zero digest
    Hash256() noexcept { bytes_.fill(0); }

    explicit Hash256(const std::array<Byte, SIZE>& bytes) noexcept : bytes_(bytes) {}

    bool IsNull() const noexcept {
        for (Byte b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return bytes_[idx]; }
    const Byte& operator[](size_t idx) const { return bytes_[idx]; }

    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    const Byte* begin() const noexcept { return bytes_.data(); }
    const Byte* end() const noexcept { return bytes_.data() + SIZE; }

    bool operator==(const Hash256& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Hash256& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Hash256& other) const noexcept { return bytes_ < other.bytes_; }

    /// 64 lowercase hex digits
    std::string ToHex() const;

    /// First 8 bytes as hex, for log lines
    std::string ToShortHex() const;

    /// Parse 64 hex digits (optional 0x prefix).
    /// Throws std::invalid_argument on any other length or a non-hex digit.
    static Hash256 FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> bytes_;
};

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    /// View over a digest
    Span(const Hash256& hash) noexcept : data_(hash.data()), size_(Hash256::SIZE) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr reference operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

private:
    pointer data_;
    size_type size_;
};

/// Read-only byte view used by the hashing API
using ByteSpan = Span<const Byte>;

/// View over the bytes of a string (UTF-8 text items, domain tags)
inline ByteSpan AsBytes(const std::string& str) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace solsafe

#endif // SOLSAFE_CORE_TYPES_H
