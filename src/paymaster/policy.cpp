// ZKGAS - Delegated Policy Authorization Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/policy.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

// ============================================================================
// MembershipPolicy
// ============================================================================

MembershipPolicy::MembershipPolicy(const Address& owner,
                                   const membership::IMembershipVerifier& verifier,
                                   GroupId groupId)
    : owner_(owner), verifier_(verifier), groupId_(groupId) {}

void MembershipPolicy::SetTarget(const Address& caller, const Address& target) {
    if (caller != owner_) {
        throw PaymasterError(PaymasterErrorCode::Unauthorized,
                             "Only the policy owner can set the target");
    }
    if (target_) {
        throw PaymasterError(PaymasterErrorCode::TargetAlreadySet,
                             "Policy target already set");
    }
    target_ = target;
    LOG_INFO(util::LogCategory::POLICY) << "Policy target set to " << target.ToHex();
}

bool MembershipPolicy::Enforce(const Address& caller, const Address& subject,
                               const std::vector<Byte>& evidence) {
    if (!target_ || caller != *target_) {
        LOG_WARN(util::LogCategory::POLICY) << "Enforce from non-target " << caller.ToHex();
        return false;
    }

    auto proof = membership::MembershipProof::Decode(evidence);
    if (!proof) {
        LOG_DEBUG(util::LogCategory::POLICY) << "Undecodable evidence for " << subject.ToHex();
        return false;
    }
    if (!verifier_.VerifyProof(groupId_, *proof)) {
        LOG_DEBUG(util::LogCategory::POLICY) << "Evidence for " << subject.ToHex()
                                             << " failed verification";
        return false;
    }

    ++enforced_;
    return true;
}

// ============================================================================
// PolicyDelegateAuthorizer
// ============================================================================

PolicyDelegateAuthorizer::PolicyDelegateAuthorizer(std::shared_ptr<IPolicy> policy,
                                                   const Address& self)
    : policy_(std::move(policy)), self_(self) {
    if (!policy_) {
        throw PaymasterError(PaymasterErrorCode::MissingCollaborator,
                             "Policy variant requires a policy");
    }
}

std::optional<AuthorizationPayload> PolicyDelegateAuthorizer::Decode(
    const std::vector<Byte>& data) const {
    auto decoded = DecodePolicyPayload(data);
    if (!decoded) {
        return std::nullopt;
    }

    AuthorizationPayload payload;
    payload.mode = AuthMode::New;
    payload.groupId = decoded->groupId;
    payload.proof = membership::MembershipProof::Decode(decoded->evidence);
    if (!payload.proof) {
        return std::nullopt;
    }
    return payload;
}

ValidationStatus PolicyDelegateAuthorizer::Authorize(const UserOperation& op,
                                                     const AuthorizationPayload& payload,
                                                     Amount /*requiredPreFund*/,
                                                     ValidationContext& context) {
    if (!payload.proof) {
        return ValidationStatus::MalformedPayload;
    }
    const membership::MembershipProof& proof = *payload.proof;

    if (proof.message != membership::ComputeMessageBinding(op.sender, op.nonce)) {
        return ValidationStatus::InvalidMessageBinding;
    }
    if (proof.scope != membership::ComputeGroupScope(payload.groupId)) {
        return ValidationStatus::InvalidScopeBinding;
    }
    if (!policy_->Enforce(self_, op.sender, proof.Encode())) {
        return ValidationStatus::PolicyRejected;
    }

    context = ValidationContext::ForGroup(payload.groupId);
    return ValidationStatus::Ok;
}

} // namespace paymaster
} // namespace zkgas
