// ZKGAS - Cached Membership Proofs
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Lets a member prove membership once and reuse that proof for later
// sponsored operations, as long as the group's membership root has not moved
// (or, under the root-aware policy, as long as the proof still verifies).

#ifndef ZKGAS_PAYMASTER_PROOF_CACHE_H
#define ZKGAS_PAYMASTER_PROOF_CACHE_H

#include <zkgas/core/types.h>
#include <zkgas/membership/proof.h>
#include <zkgas/membership/verifier.h>
#include <zkgas/paymaster/errors.h>

#include <map>
#include <optional>
#include <utility>

namespace zkgas {
namespace paymaster {

/// What to do with a cached proof once the group's root has changed
enum class StalenessPolicy {
    /// Reject; the member must submit a new proof
    RootPinned,
    /// Re-verify the stored proof against the verifier
    RootAware,
};

const char* StalenessPolicyToString(StalenessPolicy policy);

/// Cached proof for one (member, group) pair
struct CachedProof {
    GroupId groupId{0};
    membership::MembershipProof proof;
    Uint256 merkleRootAtCache;
    bool isValid{false};
};

class ProofCache {
public:
    ProofCache(const membership::IMembershipVerifier& verifier,
               StalenessPolicy policy = StalenessPolicy::RootPinned);

    /**
     * Verify a freshly submitted proof and cache it for `member`.
     *
     * Checks the message binding first, then asks the verifier. On success
     * any earlier entry for (member, groupId) is replaced.
     */
    ValidationStatus SubmitNew(const Address& member, GroupId groupId,
                               const membership::MembershipProof& proof,
                               const Uint256& expectedMessage);

    /// Authorize `member` from a previously cached proof
    ValidationStatus UseCached(const Address& member, GroupId groupId);

    /// Cached entry for (member, groupId), if any
    std::optional<CachedProof> Get(const Address& member, GroupId groupId) const;

    size_t Size() const { return entries_.size(); }

    StalenessPolicy GetPolicy() const { return policy_; }

private:
    using Key = std::pair<Address, GroupId>;

    const membership::IMembershipVerifier& verifier_;
    StalenessPolicy policy_;
    std::map<Key, CachedProof> entries_;
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_PROOF_CACHE_H
