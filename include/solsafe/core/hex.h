// SOLSAFE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Digests, salts and payloads cross every external boundary (bundle JSON,
// store envelopes, CLI arguments) as lowercase hex.

#ifndef SOLSAFE_CORE_HEX_H
#define SOLSAFE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>

namespace solsafe {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string (optionally "0x"-prefixed) to bytes.
/// Throws std::invalid_argument on odd length or a non-hex character.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// As above, and additionally require exactly expectedLen decoded bytes
std::vector<HexByte> HexToBytes(const std::string& hex, size_t expectedLen);

/// Check if string is non-empty, even-length hex (optionally "0x"-prefixed)
bool IsValidHex(const std::string& str);

} // namespace solsafe

#endif // SOLSAFE_CORE_HEX_H
