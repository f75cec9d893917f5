// ZKGAS - Delegated Policy Authorization
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// The policy variant hands the membership decision to an external policy
// contract. The paymaster only checks that the evidence is bound to the
// sender and the group; the policy decides whether it is acceptable.
// Nullifiers are not tracked, so the same evidence may be reused.

#ifndef ZKGAS_PAYMASTER_POLICY_H
#define ZKGAS_PAYMASTER_POLICY_H

#include <zkgas/core/types.h>
#include <zkgas/membership/verifier.h>
#include <zkgas/paymaster/authorizer.h>

#include <memory>
#include <optional>
#include <vector>

namespace zkgas {
namespace paymaster {

/// External capability policy
class IPolicy {
public:
    virtual ~IPolicy() = default;

    /**
     * Check `evidence` for `subject`.
     * @param caller Address making the call (the paymaster)
     * @return true if the subject passes
     */
    virtual bool Enforce(const Address& caller, const Address& subject,
                         const std::vector<Byte>& evidence) = 0;
};

/**
 * Reference policy backed by a membership verifier.
 *
 * Only its target may call Enforce. The target is set once by the owner.
 */
class MembershipPolicy : public IPolicy {
public:
    MembershipPolicy(const Address& owner,
                     const membership::IMembershipVerifier& verifier,
                     GroupId groupId);

    /// Throws PaymasterError(Unauthorized) unless caller is the owner, and
    /// PaymasterError(TargetAlreadySet) on a second call
    void SetTarget(const Address& caller, const Address& target);

    std::optional<Address> GetTarget() const { return target_; }

    bool Enforce(const Address& caller, const Address& subject,
                 const std::vector<Byte>& evidence) override;

    GroupId GetGroupId() const { return groupId_; }

    /// Number of successful Enforce calls
    uint64_t GetEnforcedCount() const { return enforced_; }

private:
    Address owner_;
    const membership::IMembershipVerifier& verifier_;
    GroupId groupId_;
    std::optional<Address> target_;
    uint64_t enforced_{0};
};

/// Authorizer for the policy variant
class PolicyDelegateAuthorizer : public IProofAuthorizer {
public:
    /// @param self Address the paymaster calls the policy from
    PolicyDelegateAuthorizer(std::shared_ptr<IPolicy> policy, const Address& self);

    const char* GetName() const override { return "policy"; }

    std::optional<AuthorizationPayload> Decode(const std::vector<Byte>& data) const override;

    ValidationStatus Authorize(const UserOperation& op,
                               const AuthorizationPayload& payload,
                               Amount requiredPreFund,
                               ValidationContext& context) override;

private:
    std::shared_ptr<IPolicy> policy_;
    Address self_;
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_POLICY_H
