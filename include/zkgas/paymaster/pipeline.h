// ZKGAS - Validation Pipeline
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#ifndef ZKGAS_PAYMASTER_PIPELINE_H
#define ZKGAS_PAYMASTER_PIPELINE_H

#include <zkgas/core/types.h>
#include <zkgas/paymaster/authorizer.h>
#include <zkgas/paymaster/errors.h>
#include <zkgas/paymaster/ledger.h>
#include <zkgas/paymaster/payload.h>
#include <zkgas/paymaster/user_operation.h>

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace zkgas {
namespace paymaster {

/// Outcome of validating one user operation
struct ValidationResult {
    ValidationStatus status{ValidationStatus::MalformedPayload};
    /// Encoded ValidationContext; empty unless approved
    std::vector<Byte> context;

    bool IsApproved() const { return status == ValidationStatus::Ok; }

    /// Relayer-facing code: 0 approved, 1 rejected
    uint32_t GetValidationData() const { return ToValidationData(status); }

    static ValidationResult Approved(const ValidationContext& ctx) {
        return {ValidationStatus::Ok, ctx.Encode()};
    }
    static ValidationResult Rejected(ValidationStatus status) {
        return {status, {}};
    }
};

/**
 * First phase of sponsorship: decode, ledger check, authorize.
 *
 * Rejections are values, never exceptions. State written by an authorizer
 * during an approved validation (cache entries, quota stamps) is speculative
 * until the host commits the operation.
 */
class ValidationPipeline {
public:
    struct Stats {
        uint64_t validated{0};
        uint64_t approved{0};
        std::map<ValidationStatus, uint64_t> rejections;
    };

    ValidationPipeline(const GroupLedger& ledger, std::unique_ptr<IProofAuthorizer> authorizer);

    ValidationResult Validate(const UserOperation& op, Amount requiredPreFund);

    const IProofAuthorizer& GetAuthorizer() const { return *authorizer_; }
    IProofAuthorizer& GetAuthorizer() { return *authorizer_; }

    const Stats& GetStats() const { return stats_; }

private:
    const GroupLedger& ledger_;
    std::unique_ptr<IProofAuthorizer> authorizer_;
    Stats stats_;

    ValidationResult Reject(const UserOperation& op, ValidationStatus status);
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_PIPELINE_H
