// ZKGAS - Proof Authorizers
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// An authorizer decides, after the ledger check, whether the sender of a user
// operation is an anonymous member allowed to spend the group's funds. Each
// paymaster variant is one authorizer, selected at construction:
//
//   DirectVerifyAuthorizer     full proof on every operation
//   CachedProofAuthorizer      full proof once, then cached per member
//   NullifierQuotaAuthorizer   epoch-scoped proofs with a gas quota
//   PolicyDelegateAuthorizer   delegated to an external policy (policy.h)

#ifndef ZKGAS_PAYMASTER_AUTHORIZER_H
#define ZKGAS_PAYMASTER_AUTHORIZER_H

#include <zkgas/core/types.h>
#include <zkgas/membership/verifier.h>
#include <zkgas/paymaster/errors.h>
#include <zkgas/paymaster/gas_meter.h>
#include <zkgas/paymaster/payload.h>
#include <zkgas/paymaster/proof_cache.h>
#include <zkgas/paymaster/user_operation.h>

#include <optional>
#include <vector>

namespace zkgas {
namespace paymaster {

class IProofAuthorizer {
public:
    virtual ~IProofAuthorizer() = default;

    /// Short name for logs
    virtual const char* GetName() const = 0;

    /// Decode this variant's payload format; nullopt if malformed
    virtual std::optional<AuthorizationPayload> Decode(const std::vector<Byte>& data) const = 0;

    /**
     * Authorize `op` against a decoded payload.
     * @param requiredPreFund Worst-case cost quoted by the relayer
     * @param context Set on success; carried to settlement
     */
    virtual ValidationStatus Authorize(const UserOperation& op,
                                       const AuthorizationPayload& payload,
                                       Amount requiredPreFund,
                                       ValidationContext& context) = 0;
};

// ============================================================================
// Direct verification
// ============================================================================

class DirectVerifyAuthorizer : public IProofAuthorizer {
public:
    explicit DirectVerifyAuthorizer(const membership::IMembershipVerifier& verifier);

    const char* GetName() const override { return "direct"; }

    std::optional<AuthorizationPayload> Decode(const std::vector<Byte>& data) const override;

    ValidationStatus Authorize(const UserOperation& op,
                               const AuthorizationPayload& payload,
                               Amount requiredPreFund,
                               ValidationContext& context) override;

private:
    const membership::IMembershipVerifier& verifier_;
};

// ============================================================================
// Cached proofs
// ============================================================================

class CachedProofAuthorizer : public IProofAuthorizer {
public:
    CachedProofAuthorizer(const membership::IMembershipVerifier& verifier,
                          StalenessPolicy policy);

    const char* GetName() const override;

    std::optional<AuthorizationPayload> Decode(const std::vector<Byte>& data) const override;

    ValidationStatus Authorize(const UserOperation& op,
                               const AuthorizationPayload& payload,
                               Amount requiredPreFund,
                               ValidationContext& context) override;

    const ProofCache& GetCache() const { return cache_; }

private:
    ProofCache cache_;
};

// ============================================================================
// Nullifier quotas
// ============================================================================

class NullifierQuotaAuthorizer : public IProofAuthorizer {
public:
    NullifierQuotaAuthorizer(const membership::IMembershipVerifier& verifier,
                             EpochGasMeter& meter);

    const char* GetName() const override { return "gaslimited"; }

    std::optional<AuthorizationPayload> Decode(const std::vector<Byte>& data) const override;

    ValidationStatus Authorize(const UserOperation& op,
                               const AuthorizationPayload& payload,
                               Amount requiredPreFund,
                               ValidationContext& context) override;

private:
    const membership::IMembershipVerifier& verifier_;
    EpochGasMeter& meter_;

    ValidationStatus AuthorizeNew(const UserOperation& op, GroupId groupId,
                                  const membership::MembershipProof& proof,
                                  Amount requiredPreFund);
    ValidationStatus AuthorizeCached(GroupId groupId, const Uint256& nullifier,
                                     Amount requiredPreFund);
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_AUTHORIZER_H
