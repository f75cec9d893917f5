// ZKGAS - SHA256 Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace zkgas {

struct SHA256::Impl {
    EVP_MD_CTX* ctx;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr) {
            throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
        }
    }

    ~Impl() { EVP_MD_CTX_free(ctx); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
    Reset();
}

Uint256 SHA256::Finalize() {
    Uint256 result;
    Finalize(result.data());
    return result;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Uint256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

Uint256 SHA256Pair(const Uint256& left, const Uint256& right) {
    SHA256 hasher;
    hasher.Write(left).Write(right);
    return hasher.Finalize();
}

} // namespace zkgas
