// SOLSAFE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/core/hex.h"

#include <stdexcept>

namespace solsafe {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Offset of the first digit after an optional "0x" prefix
size_t DigitsStart(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return 2;
    }
    return 0;
}

} // namespace

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    const size_t start = DigitsStart(hex);
    const size_t digits = hex.size() - start;
    if (digits % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<HexByte> out(digits / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int high = Nibble(hex[start + 2 * i]);
        int low = Nibble(hex[start + 2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character at offset " +
                                        std::to_string(start + 2 * i));
        }
        out[i] = static_cast<HexByte>((high << 4) | low);
    }
    return out;
}

std::vector<HexByte> HexToBytes(const std::string& hex, size_t expectedLen) {
    std::vector<HexByte> out = HexToBytes(hex);
    if (out.size() != expectedLen) {
        throw std::invalid_argument("Expected " + std::to_string(expectedLen) +
                                    " bytes of hex, got " + std::to_string(out.size()));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    const size_t start = DigitsStart(str);
    if (str.size() == start || (str.size() - start) % 2 != 0) {
        return false;
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (Nibble(str[i]) < 0) return false;
    }
    return true;
}

} // namespace solsafe
