// ZKGAS - Core Types Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/core/types.h"
#include "zkgas/core/hex.h"

namespace zkgas {

// ============================================================================
// FixedBytes Implementation
// ============================================================================

template<size_t N>
std::string FixedBytes<N>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t N>
FixedBytes<N> FixedBytes<N>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for fixed bytes");
    }

    // HexToBytes throws on invalid characters
    std::vector<HexByte> bytes = HexToBytes(digits);
    return FixedBytes(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class FixedBytes<32>;
template class FixedBytes<20>;

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256 Uint256::FromUint64(uint64_t value) {
    Uint256 result;
    for (size_t i = 0; i < 8; ++i) {
        result.data_[SIZE - 1 - i] = static_cast<Byte>(value >> (8 * i));
    }
    return result;
}

bool Uint256::FitsUint64() const noexcept {
    for (size_t i = 0; i < SIZE - 8; ++i) {
        if (data_[i] != 0) return false;
    }
    return true;
}

uint64_t Uint256::GetLow64() const noexcept {
    uint64_t value = 0;
    for (size_t i = SIZE - 8; i < SIZE; ++i) {
        value = (value << 8) | data_[i];
    }
    return value;
}

// ============================================================================
// Address Implementation
// ============================================================================

Uint256 Address::ToWord() const {
    return Uint256(data_.data(), SIZE);
}

} // namespace zkgas
