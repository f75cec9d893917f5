// ZKGAS - Epoch Gas Meter Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/gas_meter.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

EpochGasMeter::EpochGasMeter(Timestamp firstEpochTimestamp, int64_t epochDuration)
    : firstEpochTimestamp_(firstEpochTimestamp), epochDuration_(epochDuration) {
    if (epochDuration_ <= 0) {
        throw PaymasterError(PaymasterErrorCode::InvalidConfig,
                             "Epoch duration must be positive");
    }
}

EpochId EpochGasMeter::CalculateEpoch(Timestamp now) const {
    if (now <= firstEpochTimestamp_) {
        return 0;
    }
    return static_cast<EpochId>((now - firstEpochTimestamp_) / epochDuration_);
}

bool EpochGasMeter::AdvanceEpoch(Timestamp now) {
    EpochId epoch = CalculateEpoch(now);
    if (epoch <= currentEpoch_) {
        return false;
    }

    LOG_INFO(util::LogCategory::QUOTA) << "Epoch advanced from " << currentEpoch_
                                       << " to " << epoch;
    currentEpoch_ = epoch;
    return true;
}

void EpochGasMeter::SetQuota(GroupId groupId, Amount maxGasPerEpoch) {
    if (!AmountRange(maxGasPerEpoch)) {
        throw PaymasterError(PaymasterErrorCode::InvalidAmount, "Gas quota out of range");
    }
    quotas_[groupId] = maxGasPerEpoch;
    LOG_INFO(util::LogCategory::QUOTA) << "Quota for group " << groupId
                                       << " set to " << maxGasPerEpoch;
}

Amount EpochGasMeter::GetQuota(GroupId groupId) const {
    auto it = quotas_.find(groupId);
    return it == quotas_.end() ? 0 : it->second;
}

ValidationStatus EpochGasMeter::Admit(const Uint256& nullifier, GroupId groupId,
                                      Amount required) const {
    Amount quota = GetQuota(groupId);
    Amount used = EffectiveGasUsed(nullifier);

    if (used + required > quota) {
        LOG_DEBUG(util::LogCategory::QUOTA) << "Quota exceeded for group " << groupId
                                            << ": used=" << used
                                            << " required=" << required
                                            << " quota=" << quota;
        return ValidationStatus::QuotaExceeded;
    }
    return ValidationStatus::Ok;
}

void EpochGasMeter::Stamp(const Uint256& nullifier, GroupId groupId,
                          const Uint256& merkleRoot) {
    GasQuotaRecord& record = records_[nullifier];
    if (!record.exists || record.epoch < currentEpoch_) {
        record.gasUsed = 0;
    }
    record.exists = true;
    record.groupId = groupId;
    record.epoch = currentEpoch_;
    record.lastMerkleRoot = merkleRoot;
}

void EpochGasMeter::Record(const Uint256& nullifier, Amount actual) {
    records_[nullifier].gasUsed += actual;
}

GasQuotaRecord EpochGasMeter::GetRecord(const Uint256& nullifier) const {
    auto it = records_.find(nullifier);
    return it == records_.end() ? GasQuotaRecord() : it->second;
}

Amount EpochGasMeter::EffectiveGasUsed(const Uint256& nullifier) const {
    auto it = records_.find(nullifier);
    if (it == records_.end() || it->second.epoch != currentEpoch_) {
        return 0;
    }
    return it->second.gasUsed;
}

} // namespace paymaster
} // namespace zkgas
