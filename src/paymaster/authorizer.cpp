// ZKGAS - Proof Authorizers Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/authorizer.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

using membership::MembershipProof;

// ============================================================================
// DirectVerifyAuthorizer
// ============================================================================

DirectVerifyAuthorizer::DirectVerifyAuthorizer(const membership::IMembershipVerifier& verifier)
    : verifier_(verifier) {}

std::optional<AuthorizationPayload> DirectVerifyAuthorizer::Decode(
    const std::vector<Byte>& data) const {
    return DecodeAuthorizationPayload(data, CachedPayloadFormat::Empty);
}

ValidationStatus DirectVerifyAuthorizer::Authorize(const UserOperation& op,
                                                   const AuthorizationPayload& payload,
                                                   Amount /*requiredPreFund*/,
                                                   ValidationContext& context) {
    if (payload.mode != AuthMode::New || !payload.proof) {
        return ValidationStatus::UnsupportedMode;
    }
    const MembershipProof& proof = *payload.proof;

    if (proof.message != membership::ComputeMessageBinding(op.sender, op.nonce)) {
        return ValidationStatus::InvalidMessageBinding;
    }
    if (proof.scope != membership::ComputeGroupScope(payload.groupId)) {
        return ValidationStatus::InvalidScopeBinding;
    }
    if (!verifier_.VerifyProof(payload.groupId, proof)) {
        return ValidationStatus::ProofRejected;
    }

    context = ValidationContext::ForGroup(payload.groupId);
    return ValidationStatus::Ok;
}

// ============================================================================
// CachedProofAuthorizer
// ============================================================================

CachedProofAuthorizer::CachedProofAuthorizer(const membership::IMembershipVerifier& verifier,
                                             StalenessPolicy policy)
    : cache_(verifier, policy) {}

const char* CachedProofAuthorizer::GetName() const {
    return cache_.GetPolicy() == StalenessPolicy::RootAware ? "cached-aware" : "cached";
}

std::optional<AuthorizationPayload> CachedProofAuthorizer::Decode(
    const std::vector<Byte>& data) const {
    return DecodeAuthorizationPayload(data, CachedPayloadFormat::Empty);
}

ValidationStatus CachedProofAuthorizer::Authorize(const UserOperation& op,
                                                  const AuthorizationPayload& payload,
                                                  Amount /*requiredPreFund*/,
                                                  ValidationContext& context) {
    ValidationStatus status;

    if (payload.mode == AuthMode::New) {
        if (!payload.proof) {
            return ValidationStatus::MalformedPayload;
        }
        if (payload.proof->scope != membership::ComputeGroupScope(payload.groupId)) {
            return ValidationStatus::InvalidScopeBinding;
        }
        status = cache_.SubmitNew(op.sender, payload.groupId, *payload.proof,
                                  membership::ComputeMessageBinding(op.sender, op.nonce));
    } else {
        status = cache_.UseCached(op.sender, payload.groupId);
    }

    if (status == ValidationStatus::Ok) {
        context = ValidationContext::ForGroup(payload.groupId);
    }
    return status;
}

// ============================================================================
// NullifierQuotaAuthorizer
// ============================================================================

NullifierQuotaAuthorizer::NullifierQuotaAuthorizer(
    const membership::IMembershipVerifier& verifier, EpochGasMeter& meter)
    : verifier_(verifier), meter_(meter) {}

std::optional<AuthorizationPayload> NullifierQuotaAuthorizer::Decode(
    const std::vector<Byte>& data) const {
    return DecodeAuthorizationPayload(data, CachedPayloadFormat::WithNullifier);
}

ValidationStatus NullifierQuotaAuthorizer::Authorize(const UserOperation& op,
                                                     const AuthorizationPayload& payload,
                                                     Amount requiredPreFund,
                                                     ValidationContext& context) {
    ValidationStatus status;
    Uint256 nullifier;

    if (payload.mode == AuthMode::New) {
        if (!payload.proof) {
            return ValidationStatus::MalformedPayload;
        }
        nullifier = payload.proof->nullifier;
        status = AuthorizeNew(op, payload.groupId, *payload.proof, requiredPreFund);
    } else {
        if (!payload.nullifier) {
            return ValidationStatus::MalformedPayload;
        }
        nullifier = *payload.nullifier;
        status = AuthorizeCached(payload.groupId, nullifier, requiredPreFund);
    }

    if (status == ValidationStatus::Ok) {
        context = ValidationContext::ForNullifier(payload.groupId, nullifier);
    }
    return status;
}

ValidationStatus NullifierQuotaAuthorizer::AuthorizeNew(const UserOperation& op,
                                                        GroupId groupId,
                                                        const MembershipProof& proof,
                                                        Amount requiredPreFund) {
    if (proof.message != membership::ComputeMessageBinding(op.sender, op.nonce)) {
        return ValidationStatus::InvalidMessageBinding;
    }
    if (proof.scope != membership::ComputeEpochScope(groupId, meter_.GetCurrentEpoch())) {
        return ValidationStatus::InvalidScopeBinding;
    }
    if (!verifier_.VerifyProof(groupId, proof)) {
        return ValidationStatus::ProofRejected;
    }

    ValidationStatus status = meter_.Admit(proof.nullifier, groupId, requiredPreFund);
    if (status != ValidationStatus::Ok) {
        return status;
    }

    meter_.Stamp(proof.nullifier, groupId, verifier_.GetMerkleTreeRoot(groupId));
    return ValidationStatus::Ok;
}

ValidationStatus NullifierQuotaAuthorizer::AuthorizeCached(GroupId groupId,
                                                           const Uint256& nullifier,
                                                           Amount requiredPreFund) {
    GasQuotaRecord record = meter_.GetRecord(nullifier);
    if (!record.exists || record.groupId != groupId) {
        return ValidationStatus::NoCachedProof;
    }

    Uint256 currentRoot = verifier_.GetMerkleTreeRoot(groupId);
    if (record.lastMerkleRoot != currentRoot) {
        LOG_DEBUG(util::LogCategory::QUOTA) << "Nullifier " << nullifier.ToHex()
                                            << " was proven against a replaced root";
        return ValidationStatus::StaleCachedProof;
    }

    ValidationStatus status = meter_.Admit(nullifier, groupId, requiredPreFund);
    if (status != ValidationStatus::Ok) {
        return status;
    }

    meter_.Stamp(nullifier, groupId, currentRoot);
    return ValidationStatus::Ok;
}

} // namespace paymaster
} // namespace zkgas
