// ZKGAS - Validation Pipeline Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/pipeline.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

ValidationPipeline::ValidationPipeline(const GroupLedger& ledger,
                                       std::unique_ptr<IProofAuthorizer> authorizer)
    : ledger_(ledger), authorizer_(std::move(authorizer)) {
    if (!authorizer_) {
        throw PaymasterError(PaymasterErrorCode::MissingCollaborator,
                             "ValidationPipeline requires an authorizer");
    }
}

ValidationResult ValidationPipeline::Validate(const UserOperation& op, Amount requiredPreFund) {
    ++stats_.validated;

    if (!AmountRange(requiredPreFund)) {
        return Reject(op, ValidationStatus::InvalidPreFund);
    }

    auto payload = authorizer_->Decode(op.paymasterData);
    if (!payload) {
        return Reject(op, ValidationStatus::MalformedPayload);
    }

    if (!ledger_.HasSufficientBalance(payload->groupId, requiredPreFund)) {
        return Reject(op, ValidationStatus::InsufficientBalance);
    }

    ValidationContext context;
    ValidationStatus status = authorizer_->Authorize(op, *payload, requiredPreFund, context);
    if (status != ValidationStatus::Ok) {
        return Reject(op, status);
    }

    ++stats_.approved;
    LOG_DEBUG(util::LogCategory::PAYMASTER) << "Approved " << op.sender.ToHex()
                                            << " nonce=" << op.nonce
                                            << " group=" << payload->groupId
                                            << " via " << authorizer_->GetName();
    return ValidationResult::Approved(context);
}

ValidationResult ValidationPipeline::Reject(const UserOperation& op, ValidationStatus status) {
    ++stats_.rejections[status];
    LOG_DEBUG(util::LogCategory::PAYMASTER) << "Rejected " << op.sender.ToHex()
                                            << " nonce=" << op.nonce << ": "
                                            << ValidationStatusToString(status);
    return ValidationResult::Rejected(status);
}

} // namespace paymaster
} // namespace zkgas
