// ZKGAS - Paymaster Status and Error Codes
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/errors.h"

namespace zkgas {
namespace paymaster {

const char* ValidationStatusToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Ok: return "ok";
        case ValidationStatus::MalformedPayload: return "malformed payload";
        case ValidationStatus::InsufficientBalance: return "insufficient group balance";
        case ValidationStatus::InvalidMessageBinding: return "message does not bind sender";
        case ValidationStatus::InvalidScopeBinding: return "scope does not bind group";
        case ValidationStatus::NoCachedProof: return "no cached proof";
        case ValidationStatus::StaleCachedProof: return "cached proof is stale";
        case ValidationStatus::ProofRejected: return "proof rejected";
        case ValidationStatus::QuotaExceeded: return "epoch gas quota exceeded";
        case ValidationStatus::PolicyRejected: return "policy rejected evidence";
        case ValidationStatus::UnsupportedMode: return "mode not supported";
        case ValidationStatus::InvalidPreFund: return "pre-fund out of range";
        default: return "unknown";
    }
}

const char* PaymasterErrorCodeToString(PaymasterErrorCode code) {
    switch (code) {
        case PaymasterErrorCode::ZeroAmount: return "ZeroAmount";
        case PaymasterErrorCode::InvalidAmount: return "InvalidAmount";
        case PaymasterErrorCode::Unauthorized: return "Unauthorized";
        case PaymasterErrorCode::UnsupportedOperation: return "UnsupportedOperation";
        case PaymasterErrorCode::MissingCollaborator: return "MissingCollaborator";
        case PaymasterErrorCode::InvalidConfig: return "InvalidConfig";
        case PaymasterErrorCode::TargetAlreadySet: return "TargetAlreadySet";
        default: return "Unknown";
    }
}

} // namespace paymaster
} // namespace zkgas
