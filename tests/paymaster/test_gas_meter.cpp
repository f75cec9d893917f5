// ZKGAS - Epoch Gas Meter Tests
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include <gtest/gtest.h>

#include <zkgas/paymaster/gas_meter.h>

namespace zkgas {
namespace paymaster {
namespace {

class EpochGasMeterTest : public ::testing::Test {
protected:
    static constexpr Timestamp FIRST_EPOCH = 1000;
    static constexpr int64_t DURATION = 100;
    static constexpr GroupId GROUP = 5;

    EpochGasMeter meter_{FIRST_EPOCH, DURATION};
    Uint256 nullifier_ = Uint256::FromUint64(0xA1);
    Uint256 root_ = Uint256::FromUint64(0xB2);
};

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(EpochGasMeterTest, RejectsNonPositiveDuration) {
    try {
        EpochGasMeter meter(0, 0);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::InvalidConfig);
    }
    EXPECT_THROW(EpochGasMeter(0, -5), PaymasterError);
}

TEST_F(EpochGasMeterTest, QuotaDefaultsToZero) {
    EXPECT_EQ(meter_.GetQuota(GROUP), 0);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, 1), ValidationStatus::QuotaExceeded);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, 0), ValidationStatus::Ok);
}

TEST_F(EpochGasMeterTest, SetQuotaOverwrites) {
    meter_.SetQuota(GROUP, COIN);
    meter_.SetQuota(GROUP, 2 * COIN);
    EXPECT_EQ(meter_.GetQuota(GROUP), 2 * COIN);
    EXPECT_EQ(meter_.GetQuota(GROUP + 1), 0);
}

TEST_F(EpochGasMeterTest, QuotaOutOfRange) {
    meter_.SetQuota(GROUP, COIN);
    try {
        meter_.SetQuota(GROUP, -COIN);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::InvalidAmount);
    }
    EXPECT_THROW(meter_.SetQuota(GROUP, MAX_AMOUNT + 1), PaymasterError);
    EXPECT_EQ(meter_.GetQuota(GROUP), COIN);

    meter_.SetQuota(GROUP, MAX_AMOUNT);
    EXPECT_EQ(meter_.GetQuota(GROUP), MAX_AMOUNT);
}

// ============================================================================
// Epoch Tests
// ============================================================================

TEST_F(EpochGasMeterTest, EpochBeforeFirstIsZero) {
    EXPECT_EQ(meter_.CalculateEpoch(0), 0u);
    EXPECT_EQ(meter_.CalculateEpoch(FIRST_EPOCH), 0u);
    EXPECT_FALSE(meter_.AdvanceEpoch(500));
    EXPECT_EQ(meter_.GetCurrentEpoch(), 0u);
}

TEST_F(EpochGasMeterTest, AdvanceEpoch) {
    EXPECT_FALSE(meter_.AdvanceEpoch(FIRST_EPOCH + DURATION - 1));
    EXPECT_TRUE(meter_.AdvanceEpoch(FIRST_EPOCH + DURATION));
    EXPECT_EQ(meter_.GetCurrentEpoch(), 1u);

    // Idempotent within the window
    EXPECT_FALSE(meter_.AdvanceEpoch(FIRST_EPOCH + DURATION + 50));
    EXPECT_EQ(meter_.GetCurrentEpoch(), 1u);

    EXPECT_TRUE(meter_.AdvanceEpoch(FIRST_EPOCH + 5 * DURATION));
    EXPECT_EQ(meter_.GetCurrentEpoch(), 5u);
}

TEST_F(EpochGasMeterTest, EpochNeverDecreases) {
    meter_.AdvanceEpoch(FIRST_EPOCH + 3 * DURATION);
    EXPECT_FALSE(meter_.AdvanceEpoch(FIRST_EPOCH + DURATION));
    EXPECT_FALSE(meter_.AdvanceEpoch(0));
    EXPECT_EQ(meter_.GetCurrentEpoch(), 3u);
}

// ============================================================================
// Usage Tests
// ============================================================================

TEST_F(EpochGasMeterTest, AdmitWithinQuota) {
    meter_.SetQuota(GROUP, COIN);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, COIN), ValidationStatus::Ok);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, COIN + 1), ValidationStatus::QuotaExceeded);
}

TEST_F(EpochGasMeterTest, AdmitIsReadOnly) {
    meter_.SetQuota(GROUP, COIN);
    meter_.Admit(nullifier_, GROUP, COIN / 2);
    EXPECT_FALSE(meter_.GetRecord(nullifier_).exists);
    EXPECT_EQ(meter_.GetRecordCount(), 0u);
}

TEST_F(EpochGasMeterTest, StampCreatesRecord) {
    meter_.AdvanceEpoch(FIRST_EPOCH + 2 * DURATION);
    meter_.Stamp(nullifier_, GROUP, root_);

    GasQuotaRecord record = meter_.GetRecord(nullifier_);
    EXPECT_TRUE(record.exists);
    EXPECT_EQ(record.groupId, GROUP);
    EXPECT_EQ(record.gasUsed, 0);
    EXPECT_EQ(record.lastMerkleRoot, root_);
    EXPECT_EQ(record.epoch, 2u);
}

TEST_F(EpochGasMeterTest, RecordedUsageCountsAgainstQuota) {
    meter_.SetQuota(GROUP, COIN);
    meter_.Stamp(nullifier_, GROUP, root_);
    meter_.Record(nullifier_, 6 * COIN / 10);

    EXPECT_EQ(meter_.EffectiveGasUsed(nullifier_), 6 * COIN / 10);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, 4 * COIN / 10), ValidationStatus::Ok);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, 6 * COIN / 10), ValidationStatus::QuotaExceeded);
}

TEST_F(EpochGasMeterTest, RecordAddsUnconditionally) {
    meter_.SetQuota(GROUP, COIN);
    meter_.Stamp(nullifier_, GROUP, root_);
    meter_.Record(nullifier_, 3 * COIN);
    EXPECT_EQ(meter_.GetRecord(nullifier_).gasUsed, 3 * COIN);
}

TEST_F(EpochGasMeterTest, UsageResetsInNewEpoch) {
    meter_.SetQuota(GROUP, COIN);
    meter_.Stamp(nullifier_, GROUP, root_);
    meter_.Record(nullifier_, COIN);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, 1), ValidationStatus::QuotaExceeded);

    meter_.AdvanceEpoch(FIRST_EPOCH + DURATION);

    // Reads see the reset before anything is written
    EXPECT_EQ(meter_.EffectiveGasUsed(nullifier_), 0);
    EXPECT_EQ(meter_.GetRecord(nullifier_).gasUsed, COIN);
    EXPECT_EQ(meter_.Admit(nullifier_, GROUP, COIN), ValidationStatus::Ok);

    // Stamping makes the reset physical
    meter_.Stamp(nullifier_, GROUP, root_);
    GasQuotaRecord record = meter_.GetRecord(nullifier_);
    EXPECT_EQ(record.gasUsed, 0);
    EXPECT_EQ(record.epoch, 1u);
}

TEST_F(EpochGasMeterTest, StampWithinEpochKeepsUsage) {
    meter_.Stamp(nullifier_, GROUP, root_);
    meter_.Record(nullifier_, COIN / 4);

    Uint256 newRoot = Uint256::FromUint64(0xC3);
    meter_.Stamp(nullifier_, GROUP, newRoot);

    GasQuotaRecord record = meter_.GetRecord(nullifier_);
    EXPECT_EQ(record.gasUsed, COIN / 4);
    EXPECT_EQ(record.lastMerkleRoot, newRoot);
}

TEST_F(EpochGasMeterTest, NullifiersAreIndependent) {
    Uint256 other = Uint256::FromUint64(0xA2);
    meter_.SetQuota(GROUP, COIN);
    meter_.Stamp(nullifier_, GROUP, root_);
    meter_.Record(nullifier_, COIN);

    EXPECT_EQ(meter_.Admit(other, GROUP, COIN), ValidationStatus::Ok);
    EXPECT_EQ(meter_.EffectiveGasUsed(other), 0);
}

} // namespace
} // namespace paymaster
} // namespace zkgas
