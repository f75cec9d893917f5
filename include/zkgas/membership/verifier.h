// ZKGAS - Membership Verifier Interfaces
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// The paymaster treats the membership verifier as an external collaborator.
// These interfaces are the only surface it relies on.

#ifndef ZKGAS_MEMBERSHIP_VERIFIER_H
#define ZKGAS_MEMBERSHIP_VERIFIER_H

#include <zkgas/core/types.h>
#include <zkgas/membership/proof.h>

#include <optional>

namespace zkgas {
namespace membership {

/**
 * Group-membership verifier and root accessor.
 *
 * Calls are synchronous and bounded; implementations must not block.
 */
class IMembershipVerifier {
public:
    virtual ~IMembershipVerifier() = default;

    /// True if `proof` proves membership in `groupId`
    virtual bool VerifyProof(GroupId groupId, const MembershipProof& proof) const = 0;

    /// Current membership tree root (zero for unknown or empty groups)
    virtual Uint256 GetMerkleTreeRoot(GroupId groupId) const = 0;

    /// Administrator of the group, if the group exists
    virtual std::optional<Address> GetGroupAdmin(GroupId groupId) const = 0;
};

/**
 * Checks the proof points against the public inputs. This is the part of
 * verification that needs the proving system's verification key.
 */
class IProofSystem {
public:
    virtual ~IProofSystem() = default;

    virtual bool VerifyPoints(const MembershipProof& proof, uint32_t treeDepth) const = 0;
};

/// Accepts every well-formed proof. For test networks and unit tests.
class AlwaysValidProofSystem : public IProofSystem {
public:
    bool VerifyPoints(const MembershipProof&, uint32_t) const override { return true; }
};

} // namespace membership
} // namespace zkgas

#endif // ZKGAS_MEMBERSHIP_VERIFIER_H
