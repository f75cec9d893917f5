// ZKGAS - Membership Proof Record Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/membership/proof.h"
#include "zkgas/core/serialize.h"
#include "zkgas/crypto/sha256.h"

#include <sstream>

namespace zkgas {
namespace membership {

std::vector<Byte> MembershipProof::Encode() const {
    DataStream s;
    WriteFixed(s, merkleTreeDepth);
    WriteFixed(s, merkleTreeRoot);
    WriteFixed(s, nullifier);
    WriteFixed(s, message);
    WriteFixed(s, scope);
    for (const auto& point : points) {
        WriteFixed(s, point);
    }
    return s.Data();
}

std::optional<MembershipProof> MembershipProof::Decode(const Byte* data, size_t len) {
    if (data == nullptr || len != PROOF_ENCODED_SIZE) {
        return std::nullopt;
    }

    DataStream s(data, len);
    MembershipProof proof;
    proof.merkleTreeDepth = ReadUint256(s);
    proof.merkleTreeRoot = ReadUint256(s);
    proof.nullifier = ReadUint256(s);
    proof.message = ReadUint256(s);
    proof.scope = ReadUint256(s);
    for (auto& point : proof.points) {
        point = ReadUint256(s);
    }
    return proof;
}

std::string MembershipProof::ToString() const {
    std::ostringstream ss;
    ss << "MembershipProof(depth=" << merkleTreeDepth.GetLow64()
       << ", root=" << merkleTreeRoot.ToHex().substr(0, 16)
       << ", nullifier=" << nullifier.ToHex().substr(0, 16) << ")";
    return ss.str();
}

bool MembershipProof::operator==(const MembershipProof& other) const {
    return merkleTreeDepth == other.merkleTreeDepth &&
           merkleTreeRoot == other.merkleTreeRoot &&
           nullifier == other.nullifier &&
           message == other.message &&
           scope == other.scope &&
           points == other.points;
}

// ============================================================================
// Binding values
// ============================================================================

Uint256 ComputeMessageBinding(const Address& sender, uint64_t nonce) {
    SHA256 hasher;
    hasher.Write(sender.ToWord()).Write(Uint256::FromUint64(nonce));
    return hasher.Finalize();
}

Uint256 ComputeGroupScope(GroupId groupId) {
    return Uint256::FromUint64(groupId);
}

Uint256 ComputeEpochScope(GroupId groupId, EpochId epoch) {
    SHA256 hasher;
    hasher.Write(Uint256::FromUint64(groupId)).Write(Uint256::FromUint64(epoch));
    return hasher.Finalize();
}

} // namespace membership
} // namespace zkgas
