// ZKGAS - Cached Membership Proofs Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/proof_cache.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

const char* StalenessPolicyToString(StalenessPolicy policy) {
    switch (policy) {
        case StalenessPolicy::RootPinned: return "pinned";
        case StalenessPolicy::RootAware: return "aware";
        default: return "unknown";
    }
}

ProofCache::ProofCache(const membership::IMembershipVerifier& verifier,
                       StalenessPolicy policy)
    : verifier_(verifier), policy_(policy) {}

ValidationStatus ProofCache::SubmitNew(const Address& member, GroupId groupId,
                                       const membership::MembershipProof& proof,
                                       const Uint256& expectedMessage) {
    if (proof.message != expectedMessage) {
        return ValidationStatus::InvalidMessageBinding;
    }
    if (!verifier_.VerifyProof(groupId, proof)) {
        return ValidationStatus::ProofRejected;
    }

    CachedProof& entry = entries_[Key(member, groupId)];
    entry.groupId = groupId;
    entry.proof = proof;
    entry.merkleRootAtCache = verifier_.GetMerkleTreeRoot(groupId);
    entry.isValid = true;

    LOG_DEBUG(util::LogCategory::CACHE) << "Cached proof for " << member.ToHex()
                                        << " in group " << groupId;
    return ValidationStatus::Ok;
}

ValidationStatus ProofCache::UseCached(const Address& member, GroupId groupId) {
    auto it = entries_.find(Key(member, groupId));
    if (it == entries_.end() || it->second.groupId != groupId) {
        return ValidationStatus::NoCachedProof;
    }
    CachedProof& entry = it->second;

    Uint256 currentRoot = verifier_.GetMerkleTreeRoot(groupId);
    if (entry.isValid && entry.merkleRootAtCache == currentRoot) {
        return ValidationStatus::Ok;
    }

    if (policy_ == StalenessPolicy::RootPinned) {
        LOG_DEBUG(util::LogCategory::CACHE) << "Cached proof for " << member.ToHex()
                                            << " is pinned to a replaced root";
        return ValidationStatus::StaleCachedProof;
    }

    if (verifier_.VerifyProof(groupId, entry.proof)) {
        entry.merkleRootAtCache = currentRoot;
        entry.isValid = true;
        LOG_DEBUG(util::LogCategory::CACHE) << "Re-verified cached proof for "
                                            << member.ToHex() << " in group " << groupId;
        return ValidationStatus::Ok;
    }

    entry.isValid = false;
    LOG_DEBUG(util::LogCategory::CACHE) << "Cached proof for " << member.ToHex()
                                        << " no longer verifies";
    return ValidationStatus::StaleCachedProof;
}

std::optional<CachedProof> ProofCache::Get(const Address& member, GroupId groupId) const {
    auto it = entries_.find(Key(member, groupId));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace paymaster
} // namespace zkgas
