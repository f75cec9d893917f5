// ZKGAS - Authorization Payload and Validation Context Codecs
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/payload.h"
#include "zkgas/core/serialize.h"

#include <ios>

namespace zkgas {
namespace paymaster {

namespace {

void WriteGroupId(DataStream& s, GroupId groupId) {
    WriteFixed(s, Uint256::FromUint64(groupId));
}

/// Read a 256-bit group id; nullopt if it does not fit in 64 bits
template<typename Stream>
std::optional<GroupId> ReadGroupId(Stream& s) {
    Uint256 wide = ReadUint256(s);
    if (!wide.FitsUint64()) {
        return std::nullopt;
    }
    return wide.GetLow64();
}

} // namespace

// ============================================================================
// Authorization Payload
// ============================================================================

std::vector<Byte> EncodeNewPayload(GroupId groupId, const membership::MembershipProof& proof) {
    DataStream s;
    WriteUint8(s, static_cast<uint8_t>(AuthMode::New));
    WriteGroupId(s, groupId);
    std::vector<Byte> encoded = proof.Encode();
    s.Write(encoded.data(), encoded.size());
    return s.Data();
}

std::vector<Byte> EncodeCachedPayload(GroupId groupId) {
    DataStream s;
    WriteUint8(s, static_cast<uint8_t>(AuthMode::Cached));
    WriteGroupId(s, groupId);
    return s.Data();
}

std::vector<Byte> EncodeCachedPayload(GroupId groupId, const Uint256& nullifier) {
    DataStream s;
    WriteUint8(s, static_cast<uint8_t>(AuthMode::Cached));
    WriteGroupId(s, groupId);
    WriteFixed(s, nullifier);
    return s.Data();
}

std::optional<AuthorizationPayload> DecodeAuthorizationPayload(
    const std::vector<Byte>& data, CachedPayloadFormat cachedFormat) {
    try {
        DataStream s(data);
        AuthorizationPayload payload;

        uint8_t mode = ReadUint8(s);
        if (mode != static_cast<uint8_t>(AuthMode::New) &&
            mode != static_cast<uint8_t>(AuthMode::Cached)) {
            return std::nullopt;
        }
        payload.mode = static_cast<AuthMode>(mode);

        auto groupId = ReadGroupId(s);
        if (!groupId) {
            return std::nullopt;
        }
        payload.groupId = *groupId;

        if (payload.mode == AuthMode::New) {
            payload.proof = membership::MembershipProof::Decode(s.ReadRemaining());
            if (!payload.proof) {
                return std::nullopt;
            }
            return payload;
        }

        if (cachedFormat == CachedPayloadFormat::WithNullifier) {
            payload.nullifier = ReadUint256(s);
        }
        if (!s.empty()) {
            return std::nullopt;
        }
        return payload;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Policy Payload
// ============================================================================

std::vector<Byte> EncodePolicyPayload(GroupId groupId, const std::vector<Byte>& evidence) {
    DataStream s;
    WriteGroupId(s, groupId);
    s.Write(evidence.data(), evidence.size());
    return s.Data();
}

std::optional<PolicyPayload> DecodePolicyPayload(const std::vector<Byte>& data) {
    try {
        DataStream s(data);
        auto groupId = ReadGroupId(s);
        if (!groupId) {
            return std::nullopt;
        }

        PolicyPayload payload;
        payload.groupId = *groupId;
        payload.evidence = s.ReadRemaining();
        return payload;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Validation Context
// ============================================================================

ValidationContext ValidationContext::ForGroup(GroupId groupId) {
    ValidationContext ctx;
    ctx.kind = ContextKind::Group;
    ctx.groupId = groupId;
    return ctx;
}

ValidationContext ValidationContext::ForNullifier(GroupId groupId, const Uint256& nullifier) {
    ValidationContext ctx;
    ctx.kind = ContextKind::Nullifier;
    ctx.groupId = groupId;
    ctx.nullifier = nullifier;
    return ctx;
}

std::vector<Byte> ValidationContext::Encode() const {
    DataStream s;
    WriteUint8(s, static_cast<uint8_t>(kind));
    WriteGroupId(s, groupId);
    if (kind == ContextKind::Nullifier) {
        WriteFixed(s, nullifier);
    }
    return s.Data();
}

std::optional<ValidationContext> ValidationContext::Decode(const std::vector<Byte>& data) {
    try {
        DataStream s(data);
        ValidationContext ctx;

        uint8_t kind = ReadUint8(s);
        if (kind == static_cast<uint8_t>(ContextKind::Group)) {
            ctx.kind = ContextKind::Group;
        } else if (kind == static_cast<uint8_t>(ContextKind::Nullifier)) {
            ctx.kind = ContextKind::Nullifier;
        } else {
            return std::nullopt;
        }

        auto groupId = ReadGroupId(s);
        if (!groupId) {
            return std::nullopt;
        }
        ctx.groupId = *groupId;

        if (ctx.kind == ContextKind::Nullifier) {
            ctx.nullifier = ReadUint256(s);
        }
        if (!s.empty()) {
            return std::nullopt;
        }
        return ctx;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

} // namespace paymaster
} // namespace zkgas
