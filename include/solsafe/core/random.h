// SOLSAFE - Secure Random Number Generation Header
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Vote salts come from OpenSSL's CSPRNG and nowhere else. There is no
// fallback generator: if the CSPRNG fails the caller gets an exception.

#ifndef SOLSAFE_CORE_RANDOM_H
#define SOLSAFE_CORE_RANDOM_H

#include "solsafe/core/types.h"

#include <array>
#include <cstddef>

namespace solsafe {

/// Fill buf with len bytes from the CSPRNG.
/// Throws std::runtime_error if the generator is not seeded or fails.
void GetRandBytes(Byte* buf, size_t len);

/// Fixed-size random byte array
template<size_t N>
std::array<Byte, N> GetRandArray() {
    std::array<Byte, N> out;
    GetRandBytes(out.data(), N);
    return out;
}

} // namespace solsafe

#endif // SOLSAFE_CORE_RANDOM_H
