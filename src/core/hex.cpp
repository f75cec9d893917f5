// ZKGAS - Hex Encoding/Decoding Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/core/hex.h"

#include <stdexcept>

namespace zkgas {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int NibbleOf(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string StripHexPrefix(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return str.substr(2);
    }
    return str;
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<HexByte> result;
    result.reserve(digits.length() / 2);
    for (size_t i = 0; i < digits.length(); i += 2) {
        int high = NibbleOf(digits[i]);
        int low = NibbleOf(digits[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.push_back(static_cast<HexByte>((high << 4) | low));
    }
    return result;
}

bool IsValidHex(const std::string& str) {
    std::string digits = StripHexPrefix(str);
    if (digits.empty() || digits.length() % 2 != 0) {
        return false;
    }
    for (char c : digits) {
        if (NibbleOf(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace zkgas
