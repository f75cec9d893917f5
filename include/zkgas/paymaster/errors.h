// ZKGAS - Paymaster Status and Error Codes
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Two kinds of failure exist:
// - Validation rejections: returned as ValidationStatus values. The relayer
//   only ever sees a single non-zero code for all of them.
// - Hard failures of the administrative surface: thrown as PaymasterError
//   and abort the whole call.

#ifndef ZKGAS_PAYMASTER_ERRORS_H
#define ZKGAS_PAYMASTER_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zkgas {
namespace paymaster {

// ============================================================================
// Validation Status
// ============================================================================

enum class ValidationStatus {
    Ok = 0,
    MalformedPayload,
    InsufficientBalance,
    InvalidMessageBinding,
    InvalidScopeBinding,
    NoCachedProof,
    StaleCachedProof,
    ProofRejected,
    QuotaExceeded,
    PolicyRejected,
    UnsupportedMode,
    /// Required pre-fund is negative or above MAX_AMOUNT
    InvalidPreFund,
};

const char* ValidationStatusToString(ValidationStatus status);

/// Relayer-facing validation data: 0 approved, 1 any rejection
constexpr uint32_t VALIDATION_SUCCESS = 0;
constexpr uint32_t VALIDATION_FAILED = 1;

inline uint32_t ToValidationData(ValidationStatus status) {
    return status == ValidationStatus::Ok ? VALIDATION_SUCCESS : VALIDATION_FAILED;
}

// ============================================================================
// Hard Failures
// ============================================================================

enum class PaymasterErrorCode {
    ZeroAmount,
    InvalidAmount,
    Unauthorized,
    UnsupportedOperation,
    MissingCollaborator,
    InvalidConfig,
    TargetAlreadySet,
};

const char* PaymasterErrorCodeToString(PaymasterErrorCode code);

class PaymasterError : public std::runtime_error {
public:
    PaymasterError(PaymasterErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    PaymasterErrorCode GetCode() const noexcept { return code_; }

private:
    PaymasterErrorCode code_;
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_ERRORS_H
