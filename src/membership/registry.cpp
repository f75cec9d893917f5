// ZKGAS - In-Process Group Registry Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/membership/registry.h"
#include "zkgas/crypto/sha256.h"
#include "zkgas/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace zkgas {
namespace membership {

// ============================================================================
// Membership tree
// ============================================================================

Uint256 ComputeMembershipRoot(std::vector<Uint256> level) {
    if (level.empty()) {
        return Uint256();
    }

    while (level.size() > 1) {
        std::vector<Uint256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            next.push_back(SHA256Pair(level[i], level[i + 1]));
        }
        if (level.size() & 1) {
            next.push_back(level.back());
        }
        level.swap(next);
    }
    return level[0];
}

uint32_t ComputeTreeDepth(size_t leafCount) {
    uint32_t depth = 0;
    size_t width = 1;
    while (width < leafCount) {
        width <<= 1;
        ++depth;
    }
    return depth;
}

// ============================================================================
// GroupRegistry
// ============================================================================

GroupRegistry::GroupRegistry(std::shared_ptr<IProofSystem> proofSystem)
    : GroupRegistry(Config(), std::move(proofSystem)) {}

GroupRegistry::GroupRegistry(const Config& config, std::shared_ptr<IProofSystem> proofSystem)
    : config_(config), proofSystem_(std::move(proofSystem)) {
    if (!proofSystem_) {
        throw std::invalid_argument("GroupRegistry requires a proof system");
    }
}

GroupRegistry::~GroupRegistry() = default;

GroupId GroupRegistry::CreateGroup(const Address& admin) {
    GroupId id = nextGroupId_++;
    Group group;
    group.admin = admin;
    groups_.emplace(id, std::move(group));

    LOG_INFO(util::LogCategory::MEMBERSHIP) << "Created group " << id
                                            << " admin=" << admin.ToHex();
    return id;
}

bool GroupRegistry::GroupExists(GroupId groupId) const {
    return groups_.count(groupId) > 0;
}

bool GroupRegistry::AddMember(GroupId groupId, const Uint256& commitment) {
    auto it = groups_.find(groupId);
    if (it == groups_.end() || commitment.IsNull()) {
        return false;
    }

    auto& members = it->second.members;
    if (std::find(members.begin(), members.end(), commitment) != members.end()) {
        return false;
    }

    members.push_back(commitment);
    UpdateRoot(it->second);
    return true;
}

size_t GroupRegistry::AddMembers(GroupId groupId, const std::vector<Uint256>& commitments) {
    size_t added = 0;
    for (const auto& commitment : commitments) {
        if (AddMember(groupId, commitment)) {
            ++added;
        }
    }
    return added;
}

bool GroupRegistry::RemoveMember(GroupId groupId, const Uint256& commitment) {
    auto it = groups_.find(groupId);
    if (it == groups_.end()) {
        return false;
    }

    auto& members = it->second.members;
    auto pos = std::find(members.begin(), members.end(), commitment);
    if (pos == members.end()) {
        return false;
    }

    members.erase(pos);
    UpdateRoot(it->second);
    return true;
}

bool GroupRegistry::HasMember(GroupId groupId, const Uint256& commitment) const {
    auto it = groups_.find(groupId);
    if (it == groups_.end()) {
        return false;
    }
    const auto& members = it->second.members;
    return std::find(members.begin(), members.end(), commitment) != members.end();
}

size_t GroupRegistry::GetMemberCount(GroupId groupId) const {
    auto it = groups_.find(groupId);
    return it == groups_.end() ? 0 : it->second.members.size();
}

uint32_t GroupRegistry::GetMerkleTreeDepth(GroupId groupId) const {
    return ComputeTreeDepth(GetMemberCount(groupId));
}

void GroupRegistry::UpdateRoot(Group& group) {
    Uint256 newRoot = ComputeMembershipRoot(group.members);
    if (newRoot == group.root) {
        return;
    }
    if (!group.root.IsNull()) {
        group.rootHistory[group.root] = now_;
    }
    group.root = newRoot;
}

bool GroupRegistry::VerifyProof(GroupId groupId, const MembershipProof& proof) const {
    ++verifications_;

    auto reject = [this](const char* reason, GroupId id) {
        ++rejections_;
        LOG_DEBUG(util::LogCategory::MEMBERSHIP) << "Proof rejected for group " << id
                                                 << ": " << reason;
        return false;
    };

    auto it = groups_.find(groupId);
    if (it == groups_.end()) {
        return reject("unknown group", groupId);
    }
    const Group& group = it->second;

    if (group.members.empty()) {
        return reject("empty group", groupId);
    }

    if (!proof.merkleTreeDepth.FitsUint64()) {
        return reject("depth out of range", groupId);
    }
    uint64_t depth = proof.merkleTreeDepth.GetLow64();
    if (depth < 1 || depth > MAX_TREE_DEPTH) {
        return reject("depth out of range", groupId);
    }

    if (proof.merkleTreeRoot != group.root) {
        auto hist = group.rootHistory.find(proof.merkleTreeRoot);
        if (hist == group.rootHistory.end()) {
            return reject("unknown root", groupId);
        }
        if (hist->second + config_.merkleTreeDuration < now_) {
            return reject("expired root", groupId);
        }
    }

    if (!proofSystem_->VerifyPoints(proof, static_cast<uint32_t>(depth))) {
        return reject("invalid proof points", groupId);
    }
    return true;
}

Uint256 GroupRegistry::GetMerkleTreeRoot(GroupId groupId) const {
    auto it = groups_.find(groupId);
    return it == groups_.end() ? Uint256() : it->second.root;
}

std::optional<Address> GroupRegistry::GetGroupAdmin(GroupId groupId) const {
    auto it = groups_.find(groupId);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second.admin;
}

GroupRegistry::Stats GroupRegistry::GetStats() const {
    Stats stats{};
    stats.groupCount = groups_.size();
    for (const auto& [id, group] : groups_) {
        stats.totalMembers += group.members.size();
    }
    stats.verifications = verifications_;
    stats.rejections = rejections_;
    return stats;
}

} // namespace membership
} // namespace zkgas
