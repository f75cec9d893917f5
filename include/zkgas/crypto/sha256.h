// ZKGAS - SHA256 Hash Function
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface. Used for
// sender/scope binding values and membership tree hashing.

#ifndef ZKGAS_CRYPTO_SHA256_H
#define ZKGAS_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

#include "zkgas/core/types.h"

namespace zkgas {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Initializes an empty digest context
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Write a 32-byte word
    SHA256& Write(const Uint256& word) {
        return Write(word.data(), word.size());
    }

    /// Finalize the hash and write to output (OUTPUT_SIZE bytes).
    /// The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a 256-bit value
    Uint256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Uint256 SHA256Hash(const Byte* data, size_t len);

inline Uint256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA256(left || right) for two 32-byte words
Uint256 SHA256Pair(const Uint256& left, const Uint256& right);

} // namespace zkgas

#endif // ZKGAS_CRYPTO_SHA256_H
