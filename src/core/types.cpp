// SOLSAFE - Core Types Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/core/types.h"
#include "solsafe/core/hex.h"

#include <algorithm>

namespace solsafe {

std::string Hash256::ToHex() const {
    return BytesToHex(bytes_);
}

std::string Hash256::ToShortHex() const {
    return BytesToHex(bytes_.data(), 8);
}

Hash256 Hash256::FromHex(const std::string& hex) {
    Bytes decoded = HexToBytes(hex, SIZE);
    Hash256 out;
    std::copy(decoded.begin(), decoded.end(), out.bytes_.begin());
    return out;
}

} // namespace solsafe
