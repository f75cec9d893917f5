// ZKGAS - Paymaster Facade Tests
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include <gtest/gtest.h>

#include <zkgas/membership/registry.h>
#include <zkgas/paymaster/paymaster.h>
#include <zkgas/util/config.h>
#include <zkgas/util/logging.h>

#include <memory>

namespace zkgas {
namespace paymaster {
namespace {

using membership::MembershipProof;

// ============================================================================
// Test Fixtures
// ============================================================================

class PaymasterTest : public ::testing::Test {
protected:
    static constexpr int64_t EPOCH_DURATION = 3600;

    void SetUp() override {
        registry_ = std::make_shared<membership::GroupRegistry>(
            std::make_shared<membership::AlwaysValidProofSystem>());
        escrow_ = std::make_shared<InMemoryEscrow>();
        admin_ = Address::FromHex("00000000000000000000000000000000000000ad");
        sender_ = Address::FromHex("000000000000000000000000000000000000a11c");
        self_ = Address::FromHex("00000000000000000000000000000000000000aa");

        // Groups 0..5; the scenarios use group 5
        for (int i = 0; i <= 5; ++i) {
            group_ = registry_->CreateGroup(admin_);
        }
        registry_->AddMembers(group_, {Uint256::FromUint64(31), Uint256::FromUint64(32),
                                       Uint256::FromUint64(33)});
    }

    void TearDown() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
    }

    std::unique_ptr<Paymaster> Make(PaymasterVariant variant,
                                    std::shared_ptr<IPolicy> policy = nullptr) {
        PaymasterOptions options;
        options.variant = variant;
        options.firstEpochTimestamp = 0;
        options.epochDuration = EPOCH_DURATION;
        options.selfAddress = self_;
        return std::make_unique<Paymaster>(options, registry_, escrow_, policy);
    }

    MembershipProof ProofFor(uint64_t nonce, const Uint256& scope) {
        MembershipProof proof;
        proof.merkleTreeDepth = Uint256::FromUint64(registry_->GetMerkleTreeDepth(group_));
        proof.merkleTreeRoot = registry_->GetMerkleTreeRoot(group_);
        proof.nullifier = Uint256::FromUint64(0xAB);
        proof.message = membership::ComputeMessageBinding(sender_, nonce);
        proof.scope = scope;
        return proof;
    }

    UserOperation Op(uint64_t nonce, std::vector<Byte> data) {
        UserOperation op;
        op.sender = sender_;
        op.nonce = nonce;
        op.paymasterData = std::move(data);
        return op;
    }

    std::shared_ptr<membership::GroupRegistry> registry_;
    std::shared_ptr<InMemoryEscrow> escrow_;
    Address admin_;
    Address sender_;
    Address self_;
    GroupId group_{0};
};

// ============================================================================
// Scenario Tests
// ============================================================================

TEST_F(PaymasterTest, SponsorAndSettle) {
    auto paymaster = Make(PaymasterVariant::Cached);
    ASSERT_EQ(group_, 5u);
    paymaster->DepositForGroup(group_, 10 * COIN);

    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    ValidationResult result = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), COIN);
    ASSERT_TRUE(result.IsApproved());
    EXPECT_EQ(result.GetValidationData(), 0u);

    auto ctx = ValidationContext::Decode(result.context);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->groupId, 5u);

    paymaster->PostOp(result.context, COIN / 5);
    EXPECT_EQ(paymaster->GroupDeposits(group_), 10 * COIN - COIN / 5);
    EXPECT_EQ(paymaster->GroupDeposits(group_), 980000000);
}

TEST_F(PaymasterTest, CachedBeforeNew) {
    auto paymaster = Make(PaymasterVariant::Cached);
    paymaster->DepositForGroup(group_, 10 * COIN);

    ValidationResult result = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeCachedPayload(group_)), COIN);
    EXPECT_EQ(result.status, ValidationStatus::NoCachedProof);
    EXPECT_EQ(result.GetValidationData(), 1u);
}

TEST_F(PaymasterTest, QuotaPerEpoch) {
    auto paymaster = Make(PaymasterVariant::GasLimited);
    paymaster->DepositForGroup(group_, 10 * COIN);
    paymaster->SetMaxGasPerUserPerEpoch(admin_, group_, COIN);
    const Amount spend = 6 * COIN / 10;

    MembershipProof proof = ProofFor(0, membership::ComputeEpochScope(group_, 0));
    ValidationResult first = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), spend);
    ASSERT_TRUE(first.IsApproved());
    paymaster->PostOp(first.context, spend);
    EXPECT_EQ(paymaster->GasData(proof.nullifier).gasUsed, spend);

    ValidationResult second = paymaster->ValidatePaymasterUserOp(
        Op(1, EncodeCachedPayload(group_, proof.nullifier)), spend);
    EXPECT_EQ(second.status, ValidationStatus::QuotaExceeded);

    EXPECT_TRUE(paymaster->AdvanceEpoch(EPOCH_DURATION));
    EXPECT_EQ(paymaster->CurrentEpoch(), 1u);

    ValidationResult third = paymaster->ValidatePaymasterUserOp(
        Op(2, EncodeCachedPayload(group_, proof.nullifier)), COIN);
    ASSERT_TRUE(third.IsApproved());

    GasQuotaRecord record = paymaster->GasData(proof.nullifier);
    EXPECT_EQ(record.epoch, 1u);
    EXPECT_EQ(record.gasUsed, 0);
}

TEST_F(PaymasterTest, WrongMessageBinding) {
    auto paymaster = Make(PaymasterVariant::Direct);
    paymaster->DepositForGroup(group_, 10 * COIN);

    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    proof.message = membership::ComputeMessageBinding(self_, 0);

    ValidationResult result = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), COIN);
    EXPECT_EQ(result.status, ValidationStatus::InvalidMessageBinding);
}

// ============================================================================
// Administrative Surface Tests
// ============================================================================

TEST_F(PaymasterTest, DepositForwardsToEscrow) {
    auto paymaster = Make(PaymasterVariant::Cached);
    paymaster->DepositForGroup(group_, 3 * COIN);
    paymaster->DepositForGroup(group_ - 1, 2 * COIN);

    EXPECT_EQ(escrow_->GetDeposit(), 5 * COIN);
    EXPECT_EQ(paymaster->GroupDeposits(group_), 3 * COIN);
}

TEST_F(PaymasterTest, ZeroDeposit) {
    auto paymaster = Make(PaymasterVariant::Cached);
    try {
        paymaster->DepositForGroup(group_, 0);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::ZeroAmount);
    }
    EXPECT_EQ(escrow_->GetDeposit(), 0);
}

TEST_F(PaymasterTest, QuotaRequiresAdmin) {
    auto paymaster = Make(PaymasterVariant::GasLimited);
    try {
        paymaster->SetMaxGasPerUserPerEpoch(sender_, group_, COIN);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::Unauthorized);
    }
    EXPECT_EQ(paymaster->MaxGasPerUserPerEpoch(group_), 0);

    // Unknown groups have no admin
    EXPECT_THROW(paymaster->SetMaxGasPerUserPerEpoch(admin_, 99, COIN), PaymasterError);

    paymaster->SetMaxGasPerUserPerEpoch(admin_, group_, COIN);
    EXPECT_EQ(paymaster->MaxGasPerUserPerEpoch(group_), COIN);
}

TEST_F(PaymasterTest, QuotaRequiresGasLimitedVariant) {
    auto paymaster = Make(PaymasterVariant::Cached);
    try {
        paymaster->SetMaxGasPerUserPerEpoch(admin_, group_, COIN);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::UnsupportedOperation);
    }
}

TEST_F(PaymasterTest, MissingCollaborators) {
    PaymasterOptions options;
    EXPECT_THROW(Paymaster(options, nullptr, escrow_), PaymasterError);
    EXPECT_THROW(Paymaster(options, registry_, nullptr), PaymasterError);

    options.variant = PaymasterVariant::Policy;
    try {
        Paymaster paymaster(options, registry_, escrow_);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::MissingCollaborator);
    }
}

TEST_F(PaymasterTest, InvalidEpochDuration) {
    PaymasterOptions options;
    options.epochDuration = 0;
    try {
        Paymaster paymaster(options, registry_, escrow_);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::InvalidConfig);
    }
}

// ============================================================================
// Read Surface and Variant Tests
// ============================================================================

TEST_F(PaymasterTest, NegativeBalanceIsVisible) {
    auto paymaster = Make(PaymasterVariant::Direct);
    paymaster->DepositForGroup(group_, COIN);

    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    ValidationResult result = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), COIN);
    ASSERT_TRUE(result.IsApproved());

    paymaster->PostOp(result.context, 3 * COIN / 2);
    EXPECT_EQ(paymaster->GroupDeposits(group_), -COIN / 2);
    EXPECT_EQ(paymaster->GetStats().ledgerUnderflows, 1u);

    // A negative balance blocks further sponsorship
    MembershipProof next = ProofFor(1, membership::ComputeGroupScope(group_));
    EXPECT_EQ(paymaster->ValidatePaymasterUserOp(Op(1, EncodeNewPayload(group_, next)), 0).status,
              ValidationStatus::InsufficientBalance);
}

TEST_F(PaymasterTest, AmountsOutOfRange) {
    auto paymaster = Make(PaymasterVariant::Direct);

    // Group 5 holds no deposit; a negative pre-fund must not sponsor it
    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    ValidationResult result = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), -COIN);
    EXPECT_EQ(result.status, ValidationStatus::InvalidPreFund);

    // A negative cost must not credit the group
    paymaster->PostOp(ValidationContext::ForGroup(group_).Encode(), -5 * COIN);
    EXPECT_EQ(paymaster->GroupDeposits(group_), 0);
    EXPECT_EQ(paymaster->GetStats().droppedSettlements, 1u);
    EXPECT_EQ(paymaster->GetStats().totalDebited, 0);

    auto limited = Make(PaymasterVariant::GasLimited);
    try {
        limited->SetMaxGasPerUserPerEpoch(admin_, group_, -COIN);
        FAIL() << "expected PaymasterError";
    } catch (const PaymasterError& e) {
        EXPECT_EQ(e.GetCode(), PaymasterErrorCode::InvalidAmount);
    }
    EXPECT_EQ(limited->MaxGasPerUserPerEpoch(group_), 0);
}

TEST_F(PaymasterTest, AdvanceEpochIsIdempotent) {
    auto paymaster = Make(PaymasterVariant::GasLimited);
    EXPECT_EQ(paymaster->CurrentEpoch(), 0u);
    EXPECT_FALSE(paymaster->AdvanceEpoch(EPOCH_DURATION - 1));
    EXPECT_TRUE(paymaster->AdvanceEpoch(2 * EPOCH_DURATION));
    EXPECT_FALSE(paymaster->AdvanceEpoch(2 * EPOCH_DURATION + 10));
    EXPECT_EQ(paymaster->CurrentEpoch(), 2u);
}

TEST_F(PaymasterTest, ConsoleLogging) {
    util::Logger::Instance().ClearSinks();

    PaymasterOptions options;
    options.printToConsole = true;
    options.logLevel = util::LogLevel::Warn;
    {
        Paymaster first(options, registry_, escrow_);
        EXPECT_EQ(util::Logger::Instance().SinkCount(), 1u);
        EXPECT_EQ(util::Logger::Instance().GetLevel(), util::LogLevel::Warn);
        {
            Paymaster second(options, registry_, escrow_);
            EXPECT_EQ(util::Logger::Instance().SinkCount(), 2u);
        }
        EXPECT_EQ(util::Logger::Instance().SinkCount(), 1u);
    }
    EXPECT_EQ(util::Logger::Instance().SinkCount(), 0u);

    // A constructor that throws leaves no sink behind
    options.variant = PaymasterVariant::Policy;
    EXPECT_THROW(Paymaster(options, registry_, escrow_), PaymasterError);
    EXPECT_EQ(util::Logger::Instance().SinkCount(), 0u);
}

TEST_F(PaymasterTest, ProofCacheExposedForCachedVariant) {
    EXPECT_NE(Make(PaymasterVariant::Cached)->GetProofCache(), nullptr);
    EXPECT_EQ(Make(PaymasterVariant::Direct)->GetProofCache(), nullptr);
}

TEST_F(PaymasterTest, PolicyVariant) {
    auto policy = std::make_shared<MembershipPolicy>(admin_, *registry_, group_);
    policy->SetTarget(admin_, self_);
    auto paymaster = Make(PaymasterVariant::Policy, policy);
    paymaster->DepositForGroup(group_, 10 * COIN);

    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    UserOperation op = Op(0, EncodePolicyPayload(group_, proof.Encode()));

    EXPECT_TRUE(paymaster->ValidatePaymasterUserOp(op, COIN).IsApproved());
    EXPECT_TRUE(paymaster->ValidatePaymasterUserOp(op, COIN).IsApproved());
    EXPECT_EQ(policy->GetEnforcedCount(), 2u);
}

TEST_F(PaymasterTest, Stats) {
    auto paymaster = Make(PaymasterVariant::Cached);
    paymaster->DepositForGroup(group_, 10 * COIN);

    MembershipProof proof = ProofFor(0, membership::ComputeGroupScope(group_));
    ValidationResult ok = paymaster->ValidatePaymasterUserOp(
        Op(0, EncodeNewPayload(group_, proof)), COIN);
    paymaster->ValidatePaymasterUserOp(Op(1, {0xFF}), COIN);
    paymaster->PostOp(ok.context, COIN / 10);
    paymaster->PostOp({0x42}, COIN);

    auto stats = paymaster->GetStats();
    EXPECT_EQ(stats.validated, 2u);
    EXPECT_EQ(stats.approved, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.settled, 1u);
    EXPECT_EQ(stats.droppedSettlements, 1u);
    EXPECT_EQ(stats.totalDeposited, 10 * COIN);
    EXPECT_EQ(stats.totalDebited, COIN / 10);
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(PaymasterOptionsTest, Defaults) {
    PaymasterOptions options;
    EXPECT_EQ(options.variant, PaymasterVariant::Cached);
    EXPECT_EQ(options.stalenessPolicy, StalenessPolicy::RootPinned);
    EXPECT_GT(options.epochDuration, 0);
    EXPECT_FALSE(options.logLevel.has_value());
    EXPECT_FALSE(options.printToConsole);
}

TEST(PaymasterOptionsTest, FromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(R"(
[paymaster]
variant = GasLimited
stalenesspolicy = aware
epochduration = 600
firstepochtimestamp = 1700000000
address = 0x00000000000000000000000000000000000000aa
loglevel = debug
printtoconsole = yes
)").success);

    PaymasterOptions options;
    auto result = PaymasterOptions::FromConfig(config, options);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(options.variant, PaymasterVariant::GasLimited);
    EXPECT_EQ(options.stalenessPolicy, StalenessPolicy::RootAware);
    EXPECT_EQ(options.epochDuration, 600);
    EXPECT_EQ(options.firstEpochTimestamp, 1700000000);
    EXPECT_EQ(options.selfAddress[19], 0xAA);
    ASSERT_TRUE(options.logLevel.has_value());
    EXPECT_EQ(*options.logLevel, util::LogLevel::Debug);
    EXPECT_TRUE(options.printToConsole);
}

TEST(PaymasterOptionsTest, FromConfigKeepsUnsetValues) {
    util::ConfigManager config;
    config.ParseString("[paymaster]\nvariant=direct\n");

    PaymasterOptions options;
    options.epochDuration = 42;
    ASSERT_TRUE(PaymasterOptions::FromConfig(config, options).success);
    EXPECT_EQ(options.variant, PaymasterVariant::Direct);
    EXPECT_EQ(options.epochDuration, 42);
}

TEST(PaymasterOptionsTest, FromConfigRejectsBadValues) {
    const char* bad[] = {
        "[paymaster]\nvariant=ignoreroot\n",
        "[paymaster]\nstalenesspolicy=never\n",
        "[paymaster]\nepochduration=0\n",
        "[paymaster]\nepochduration=soon\n",
        "[paymaster]\nfirstepochtimestamp=yesterday\n",
        "[paymaster]\naddress=0x1234\n",
        "[paymaster]\nloglevel=loud\n",
        "[paymaster]\nprinttoconsole=maybe\n",
    };
    for (const char* text : bad) {
        util::ConfigManager config;
        ASSERT_TRUE(config.ParseString(text).success);
        PaymasterOptions options;
        auto result = PaymasterOptions::FromConfig(config, options);
        EXPECT_FALSE(result.success) << text;
        EXPECT_FALSE(result.errorMessage.empty());
    }
}

TEST(PaymasterOptionsTest, VariantNames) {
    PaymasterVariant variant;
    for (auto v : {PaymasterVariant::Direct, PaymasterVariant::Cached,
                   PaymasterVariant::GasLimited, PaymasterVariant::Policy}) {
        ASSERT_TRUE(ParsePaymasterVariant(PaymasterVariantToString(v), variant));
        EXPECT_EQ(variant, v);
    }
}

} // namespace
} // namespace paymaster
} // namespace zkgas
