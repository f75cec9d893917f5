// ZKGAS - Epoch Gas Meter
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Tracks sponsored gas per nullifier and bounds it by a per-group quota that
// refreshes every epoch. The epoch counter only moves when AdvanceEpoch is
// called; validation treats it as frozen.

#ifndef ZKGAS_PAYMASTER_GAS_METER_H
#define ZKGAS_PAYMASTER_GAS_METER_H

#include <zkgas/core/types.h>
#include <zkgas/paymaster/errors.h>

#include <cstdint>
#include <map>

namespace zkgas {
namespace paymaster {

/// Gas usage of one nullifier
struct GasQuotaRecord {
    /// False for a default-constructed (never stamped) record
    bool exists{false};
    GroupId groupId{0};
    Amount gasUsed{0};
    Uint256 lastMerkleRoot;
    EpochId epoch{0};
};

class EpochGasMeter {
public:
    /// Throws PaymasterError(InvalidConfig) if epochDuration <= 0
    EpochGasMeter(Timestamp firstEpochTimestamp, int64_t epochDuration);

    // --- Epochs ---

    /**
     * Move the epoch counter to the epoch containing `now`.
     * Before the first epoch the counter stays at 0, and it never decreases.
     * @return true if the counter changed
     */
    bool AdvanceEpoch(Timestamp now);

    EpochId GetCurrentEpoch() const { return currentEpoch_; }

    /// Epoch containing `now` (not clamped against the current counter)
    EpochId CalculateEpoch(Timestamp now) const;

    Timestamp GetFirstEpochTimestamp() const { return firstEpochTimestamp_; }
    int64_t GetEpochDuration() const { return epochDuration_; }

    // --- Quotas ---

    /// Overwrite the per-nullifier quota for a group.
    /// Throws PaymasterError(InvalidAmount) outside [0, MAX_AMOUNT].
    void SetQuota(GroupId groupId, Amount maxGasPerEpoch);

    /// Quota for a group (0 if never set)
    Amount GetQuota(GroupId groupId) const;

    // --- Usage ---

    /// Check that `required` more gas fits within the quota. Read-only.
    ValidationStatus Admit(const Uint256& nullifier, GroupId groupId, Amount required) const;

    /// Record epoch and root after a successful admit; resets usage left
    /// over from an earlier epoch
    void Stamp(const Uint256& nullifier, GroupId groupId, const Uint256& merkleRoot);

    /// Add actual gas spent at settlement
    void Record(const Uint256& nullifier, Amount actual);

    /// Stored record (exists == false if none)
    GasQuotaRecord GetRecord(const Uint256& nullifier) const;

    /// Usage that counts against the current epoch's quota
    Amount EffectiveGasUsed(const Uint256& nullifier) const;

    size_t GetRecordCount() const { return records_.size(); }

private:
    Timestamp firstEpochTimestamp_;
    int64_t epochDuration_;
    EpochId currentEpoch_{0};

    std::map<GroupId, Amount> quotas_;
    std::map<Uint256, GasQuotaRecord> records_;
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_GAS_METER_H
