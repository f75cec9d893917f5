// ZKGAS - Core Types Header
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// This file defines fundamental types used throughout ZKGAS.

#ifndef ZKGAS_CORE_TYPES_H
#define ZKGAS_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace zkgas {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units. Signed so that a ledger underflow is visible.
using Amount = int64_t;

/// Timestamp (Unix epoch seconds), always supplied by the caller
using Timestamp = int64_t;

/// Group identifier (sequential, assigned by the membership registry)
using GroupId = uint64_t;

/// Epoch counter
using EpochId = uint64_t;

/// Base units per display unit
constexpr Amount COIN = 100000000LL;

/// Upper bound for a single deposit or cost value
constexpr Amount MAX_AMOUNT = 21000000000LL * COIN;

/// Check if amount is a valid positive transfer value
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

// ============================================================================
// Fixed-size byte strings
// ============================================================================

/// Fixed-size byte string stored in big-endian (network) order.
template<size_t N>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    /// Default constructor - all zeros
    FixedBytes() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit FixedBytes(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes; shorter input is left-padded with zeros
    FixedBytes(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data == nullptr || len == 0) {
            return;
        }
        if (len >= SIZE) {
            std::memcpy(data_.data(), data + (len - SIZE), SIZE);
        } else {
            std::memcpy(data_.data() + (SIZE - len), data, len);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(),
                           [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const FixedBytes& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const FixedBytes& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic order, which is numeric order for big-endian values
    bool operator<(const FixedBytes& other) const noexcept {
        return data_ < other.data_;
    }

    /// Hex string in storage order, without prefix
    std::string ToHex() const;

    /// Parse from hex (optional "0x" prefix, exactly 2*SIZE digits).
    /// Throws std::invalid_argument on malformed input.
    static FixedBytes FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Uint256
// ============================================================================

/// 256-bit big-endian value: merkle roots, nullifiers, messages, scopes
class Uint256 : public FixedBytes<32> {
public:
    using FixedBytes<32>::FixedBytes;
    Uint256() = default;
    explicit Uint256(const FixedBytes<32>& b) : FixedBytes<32>(b) {}

    /// Widen a 64-bit value
    static Uint256 FromUint64(uint64_t value);

    static Uint256 FromHex(const std::string& hex) {
        return Uint256(FixedBytes<32>::FromHex(hex));
    }

    /// True if the upper 192 bits are zero
    bool FitsUint64() const noexcept;

    /// Low 64 bits
    uint64_t GetLow64() const noexcept;
};

// ============================================================================
// Address
// ============================================================================

/// 160-bit account address (sender, admin, policy target)
class Address : public FixedBytes<20> {
public:
    using FixedBytes<20>::FixedBytes;
    Address() = default;
    explicit Address(const FixedBytes<20>& b) : FixedBytes<20>(b) {}

    static Address FromHex(const std::string& hex) {
        return Address(FixedBytes<20>::FromHex(hex));
    }

    /// Left-pad to a 32-byte word
    Uint256 ToWord() const;
};

} // namespace zkgas

#endif // ZKGAS_CORE_TYPES_H
