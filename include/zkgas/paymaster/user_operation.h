// ZKGAS - User Operation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#ifndef ZKGAS_PAYMASTER_USER_OPERATION_H
#define ZKGAS_PAYMASTER_USER_OPERATION_H

#include <zkgas/core/types.h>

#include <cstdint>
#include <vector>

namespace zkgas {
namespace paymaster {

/// Meta-transaction submitted by a relayer on behalf of `sender`
struct UserOperation {
    Address sender;
    uint64_t nonce{0};
    /// Authorization payload for the paymaster
    std::vector<Byte> paymasterData;
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_USER_OPERATION_H
