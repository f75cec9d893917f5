// ZKGAS - In-Process Group Registry
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Reference implementation of IMembershipVerifier. Maintains groups of
// identity commitments, a membership tree root per group, and a short root
// history so proofs generated just before a membership change stay valid
// for a grace period.

#ifndef ZKGAS_MEMBERSHIP_REGISTRY_H
#define ZKGAS_MEMBERSHIP_REGISTRY_H

#include <zkgas/core/types.h>
#include <zkgas/membership/proof.h>
#include <zkgas/membership/verifier.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace zkgas {
namespace membership {

/// Root of the membership tree over `leaves`. Pairs are hashed with SHA-256;
/// an unpaired node is carried up unchanged. Empty input gives zero.
Uint256 ComputeMembershipRoot(std::vector<Uint256> leaves);

/// Number of levels above the leaves for `leafCount` leaves
uint32_t ComputeTreeDepth(size_t leafCount);

/**
 * Groups of identity commitments with root tracking.
 *
 * Time is supplied by the caller (SetTime, or the timestamp passed to
 * membership changes); the registry never reads a clock.
 */
class GroupRegistry : public IMembershipVerifier {
public:
    struct Config {
        /// Seconds a replaced root remains acceptable
        int64_t merkleTreeDuration = 3600;

        Config() = default;
    };

    struct Stats {
        uint64_t groupCount;
        uint64_t totalMembers;
        uint64_t verifications;
        uint64_t rejections;
    };

    explicit GroupRegistry(std::shared_ptr<IProofSystem> proofSystem);
    GroupRegistry(const Config& config, std::shared_ptr<IProofSystem> proofSystem);
    ~GroupRegistry() override;

    /// Set the time used for root expiry checks
    void SetTime(Timestamp now) { now_ = now; }
    Timestamp GetTime() const { return now_; }

    // --- Group management ---

    /// Create a group; ids are assigned sequentially from 0
    GroupId CreateGroup(const Address& admin);

    bool GroupExists(GroupId groupId) const;

    /// Add a commitment. Fails for unknown groups, zero or duplicate commitments.
    bool AddMember(GroupId groupId, const Uint256& commitment);

    /// Add several commitments; returns how many were added
    size_t AddMembers(GroupId groupId, const std::vector<Uint256>& commitments);

    /// Remove a commitment
    bool RemoveMember(GroupId groupId, const Uint256& commitment);

    bool HasMember(GroupId groupId, const Uint256& commitment) const;

    size_t GetMemberCount(GroupId groupId) const;

    uint32_t GetMerkleTreeDepth(GroupId groupId) const;

    // --- IMembershipVerifier ---

    bool VerifyProof(GroupId groupId, const MembershipProof& proof) const override;

    Uint256 GetMerkleTreeRoot(GroupId groupId) const override;

    std::optional<Address> GetGroupAdmin(GroupId groupId) const override;

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    struct Group {
        Address admin;
        std::vector<Uint256> members;
        Uint256 root;
        /// Replaced roots and the time they were replaced
        std::map<Uint256, Timestamp> rootHistory;
    };

    Config config_;
    std::shared_ptr<IProofSystem> proofSystem_;
    std::map<GroupId, Group> groups_;
    GroupId nextGroupId_{0};
    Timestamp now_{0};

    mutable uint64_t verifications_{0};
    mutable uint64_t rejections_{0};

    /// Recompute the root after a membership change
    void UpdateRoot(Group& group);
};

} // namespace membership
} // namespace zkgas

#endif // ZKGAS_MEMBERSHIP_REGISTRY_H
