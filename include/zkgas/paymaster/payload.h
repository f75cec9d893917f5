// ZKGAS - Authorization Payload and Validation Context Codecs
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Wire formats (all integers big-endian, fixed offsets):
//
//   Authorization payload
//     [0]       mode: 0x00 New, 0x01 Cached
//     [1..33)   group id (256-bit; upper 192 bits must be zero)
//     New:      encoded membership proof, exactly 416 bytes
//     Cached:   nothing, or a 32-byte nullifier for the quota variant
//
//   Policy payload
//     [0..32)   group id
//     [32..)    evidence (an encoded membership proof)
//
//   Validation context
//     [0]       kind: 0x00 group, 0x01 group + nullifier
//     [1..33)   group id
//     [33..65)  nullifier (nullifier kind only)

#ifndef ZKGAS_PAYMASTER_PAYLOAD_H
#define ZKGAS_PAYMASTER_PAYLOAD_H

#include <zkgas/core/types.h>
#include <zkgas/membership/proof.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace zkgas {
namespace paymaster {

// ============================================================================
// Authorization Payload
// ============================================================================

enum class AuthMode : uint8_t {
    New = 0x00,
    Cached = 0x01,
};

/// Shape of a Cached-mode payload tail
enum class CachedPayloadFormat {
    /// Nothing follows the group id
    Empty,
    /// A 32-byte nullifier follows the group id
    WithNullifier,
};

/// Size of the mode byte plus group id
constexpr size_t PAYLOAD_HEADER_SIZE = 1 + Uint256::SIZE;

struct AuthorizationPayload {
    AuthMode mode{AuthMode::New};
    GroupId groupId{0};
    /// Present in New mode
    std::optional<membership::MembershipProof> proof;
    /// Present in Cached mode with CachedPayloadFormat::WithNullifier
    std::optional<Uint256> nullifier;
};

std::vector<Byte> EncodeNewPayload(GroupId groupId, const membership::MembershipProof& proof);

std::vector<Byte> EncodeCachedPayload(GroupId groupId);

std::vector<Byte> EncodeCachedPayload(GroupId groupId, const Uint256& nullifier);

/// Strict decode; trailing or missing bytes and unknown modes give nullopt
std::optional<AuthorizationPayload> DecodeAuthorizationPayload(
    const std::vector<Byte>& data, CachedPayloadFormat cachedFormat);

// ============================================================================
// Policy Payload
// ============================================================================

struct PolicyPayload {
    GroupId groupId{0};
    std::vector<Byte> evidence;
};

std::vector<Byte> EncodePolicyPayload(GroupId groupId, const std::vector<Byte>& evidence);

std::optional<PolicyPayload> DecodePolicyPayload(const std::vector<Byte>& data);

// ============================================================================
// Validation Context
// ============================================================================

enum class ContextKind : uint8_t {
    Group = 0x00,
    Nullifier = 0x01,
};

/// Carried from validation to settlement
struct ValidationContext {
    ContextKind kind{ContextKind::Group};
    GroupId groupId{0};
    Uint256 nullifier;

    static ValidationContext ForGroup(GroupId groupId);
    static ValidationContext ForNullifier(GroupId groupId, const Uint256& nullifier);

    std::vector<Byte> Encode() const;

    static std::optional<ValidationContext> Decode(const std::vector<Byte>& data);

    bool operator==(const ValidationContext& other) const {
        return kind == other.kind && groupId == other.groupId &&
               nullifier == other.nullifier;
    }
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_PAYLOAD_H
