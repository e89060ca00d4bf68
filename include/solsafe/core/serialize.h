// SOLSAFE - Serialization Header
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Fixed-width little-endian binary encoding. Used for the persisted vote
// commitment record and for integers fed into domain-separated hashes.
// Every field has a fixed size, so there are no length prefixes.

#ifndef SOLSAFE_CORE_SERIALIZE_H
#define SOLSAFE_CORE_SERIALIZE_H

#include "solsafe/core/types.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <type_traits>

namespace solsafe {

// ============================================================================
// Integer Encoding
// ============================================================================

/// Little-endian bytes of an unsigned integer
template<typename T>
std::array<Byte, sizeof(T)> EncodeLE(T value) {
    static_assert(std::is_unsigned<T>::value, "EncodeLE takes unsigned integers");
    std::array<Byte, sizeof(T)> out;
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<Byte>(value >> (8 * i));
    }
    return out;
}

/// Inverse of EncodeLE
template<typename T>
T DecodeLE(const std::array<Byte, sizeof(T)>& bytes) {
    static_assert(std::is_unsigned<T>::value, "DecodeLE takes unsigned integers");
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(bytes[i]) << (8 * i);
    }
    return value;
}

/// 8-byte little-endian encoding of a case id or other 64-bit value
inline std::array<Byte, 8> EncodeLE64(uint64_t value) {
    return EncodeLE<uint64_t>(value);
}

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const Bytes& data) : data_(data) {}
    explicit DataStream(Bytes&& data) : data_(std::move(data)) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Whole buffer, including bytes already read
    const Bytes& Data() const noexcept { return data_; }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    /// Throws std::ios_base::failure when fewer than len bytes remain
    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(readPos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(readPos_ + len), dst);
        readPos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj) {
        Serialize(*this, obj);
        return *this;
    }

    template<typename T>
    DataStream& operator>>(T& obj) {
        Unserialize(*this, obj);
        return *this;
    }

private:
    Bytes data_;
    size_t readPos_ = 0;
};

// ============================================================================
// Field Encodings
// ============================================================================

inline void Serialize(DataStream& s, uint8_t a) { s.Write(&a, 1); }

inline void Unserialize(DataStream& s, uint8_t& a) { s.Read(&a, 1); }

inline void Serialize(DataStream& s, uint64_t a) {
    auto bytes = EncodeLE(a);
    s.Write(bytes.data(), bytes.size());
}

inline void Unserialize(DataStream& s, uint64_t& a) {
    std::array<Byte, 8> bytes;
    s.Read(bytes.data(), bytes.size());
    a = DecodeLE<uint64_t>(bytes);
}

/// Booleans are one byte; anything other than 0 or 1 is rejected on read
inline void Serialize(DataStream& s, bool a) { Serialize(s, static_cast<uint8_t>(a ? 1 : 0)); }

inline void Unserialize(DataStream& s, bool& a) {
    uint8_t v = 0;
    Unserialize(s, v);
    if (v > 1) {
        throw std::ios_base::failure("non-canonical boolean");
    }
    a = (v == 1);
}

/// Fixed arrays and digests are written raw
template<size_t N>
void Serialize(DataStream& s, const std::array<Byte, N>& arr) {
    s.Write(arr.data(), N);
}

template<size_t N>
void Unserialize(DataStream& s, std::array<Byte, N>& arr) {
    s.Read(arr.data(), N);
}

inline void Serialize(DataStream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

inline void Unserialize(DataStream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

} // namespace solsafe

#endif // SOLSAFE_CORE_SERIALIZE_H
