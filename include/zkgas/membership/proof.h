// ZKGAS - Membership Proof Record
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// The proof record produced by a group-membership prover. The proving system
// itself is external; this module only carries the public inputs and proof
// points, and defines the binding values a proof must commit to.

#ifndef ZKGAS_MEMBERSHIP_PROOF_H
#define ZKGAS_MEMBERSHIP_PROOF_H

#include <zkgas/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkgas {
namespace membership {

/// Number of group elements in a proof
constexpr size_t PROOF_POINT_COUNT = 8;

/// Encoded size: depth, root, nullifier, message, scope, points[8]
constexpr size_t PROOF_ENCODED_SIZE = (5 + PROOF_POINT_COUNT) * Uint256::SIZE;

/// Deepest membership tree a proof may claim
constexpr uint32_t MAX_TREE_DEPTH = 32;

/**
 * A zero-knowledge proof of group membership.
 *
 * Public inputs:
 * - merkleTreeDepth / merkleTreeRoot: the membership tree the proof was made
 *   against (a snapshot; the group's live root may have moved on)
 * - nullifier: unique per (identity, scope)
 * - message: application value the prover commits to (sender binding)
 * - scope: context the proof is valid for (group, or group and epoch)
 */
struct MembershipProof {
    Uint256 merkleTreeDepth;
    Uint256 merkleTreeRoot;
    Uint256 nullifier;
    Uint256 message;
    Uint256 scope;
    std::array<Uint256, PROOF_POINT_COUNT> points;

    /// Fixed 416-byte big-endian encoding
    std::vector<Byte> Encode() const;

    /// Decode; input must be exactly PROOF_ENCODED_SIZE bytes
    static std::optional<MembershipProof> Decode(const Byte* data, size_t len);

    static std::optional<MembershipProof> Decode(const std::vector<Byte>& data) {
        return Decode(data.data(), data.size());
    }

    std::string ToString() const;

    bool operator==(const MembershipProof& other) const;
    bool operator!=(const MembershipProof& other) const { return !(*this == other); }
};

// ============================================================================
// Binding values
// ============================================================================

/// Message a proof must carry to sponsor `sender` at `nonce`:
/// SHA256(pad32(sender) || be256(nonce))
Uint256 ComputeMessageBinding(const Address& sender, uint64_t nonce);

/// Scope binding a proof to a group
Uint256 ComputeGroupScope(GroupId groupId);

/// Scope binding a proof to a group within one epoch:
/// SHA256(be256(groupId) || be256(epoch))
Uint256 ComputeEpochScope(GroupId groupId, EpochId epoch);

} // namespace membership
} // namespace zkgas

#endif // ZKGAS_MEMBERSHIP_PROOF_H
