// ZKGAS - Membership-Gated Paymaster Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/paymaster.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zkgas {
namespace paymaster {

namespace {

const char* const CONFIG_SECTION = "paymaster";

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::shared_ptr<IFundEscrow> RequireEscrow(std::shared_ptr<IFundEscrow> escrow) {
    if (!escrow) {
        throw PaymasterError(PaymasterErrorCode::MissingCollaborator,
                             "Paymaster requires a fund escrow");
    }
    return escrow;
}

} // namespace

// ============================================================================
// Options
// ============================================================================

const char* PaymasterVariantToString(PaymasterVariant variant) {
    switch (variant) {
        case PaymasterVariant::Direct: return "direct";
        case PaymasterVariant::Cached: return "cached";
        case PaymasterVariant::GasLimited: return "gaslimited";
        case PaymasterVariant::Policy: return "policy";
        default: return "unknown";
    }
}

bool ParsePaymasterVariant(const std::string& str, PaymasterVariant& out) {
    std::string lower = ToLower(str);
    if (lower == "direct") {
        out = PaymasterVariant::Direct;
    } else if (lower == "cached") {
        out = PaymasterVariant::Cached;
    } else if (lower == "gaslimited") {
        out = PaymasterVariant::GasLimited;
    } else if (lower == "policy") {
        out = PaymasterVariant::Policy;
    } else {
        return false;
    }
    return true;
}

bool ParseStalenessPolicy(const std::string& str, StalenessPolicy& out) {
    std::string lower = ToLower(str);
    if (lower == "pinned") {
        out = StalenessPolicy::RootPinned;
    } else if (lower == "aware") {
        out = StalenessPolicy::RootAware;
    } else {
        return false;
    }
    return true;
}

util::ConfigParseResult PaymasterOptions::FromConfig(const util::ConfigManager& config,
                                                     PaymasterOptions& out) {
    if (auto value = config.TryGetString("variant", CONFIG_SECTION)) {
        if (!ParsePaymasterVariant(*value, out.variant)) {
            return util::ConfigParseResult::Error("Invalid paymaster.variant: " + *value);
        }
    }

    if (auto value = config.TryGetString("stalenesspolicy", CONFIG_SECTION)) {
        if (!ParseStalenessPolicy(*value, out.stalenessPolicy)) {
            return util::ConfigParseResult::Error("Invalid paymaster.stalenesspolicy: " + *value);
        }
    }

    if (config.HasKey("epochduration", CONFIG_SECTION)) {
        auto duration = config.TryGetInt("epochduration", CONFIG_SECTION);
        if (!duration || *duration <= 0) {
            return util::ConfigParseResult::Error(
                "paymaster.epochduration must be a positive number of seconds");
        }
        out.epochDuration = *duration;
    }

    if (config.HasKey("firstepochtimestamp", CONFIG_SECTION)) {
        auto first = config.TryGetInt("firstepochtimestamp", CONFIG_SECTION);
        if (!first) {
            return util::ConfigParseResult::Error(
                "paymaster.firstepochtimestamp must be an integer");
        }
        out.firstEpochTimestamp = *first;
    }

    if (auto value = config.TryGetString("address", CONFIG_SECTION)) {
        try {
            out.selfAddress = Address::FromHex(*value);
        } catch (const std::invalid_argument&) {
            return util::ConfigParseResult::Error("Invalid paymaster.address: " + *value);
        }
    }

    if (auto value = config.TryGetString("loglevel", CONFIG_SECTION)) {
        util::LogLevel level;
        if (!util::ParseLogLevel(*value, level)) {
            return util::ConfigParseResult::Error("Invalid paymaster.loglevel: " + *value);
        }
        out.logLevel = level;
    }

    if (config.HasKey("printtoconsole", CONFIG_SECTION)) {
        auto print = config.TryGetBool("printtoconsole", CONFIG_SECTION);
        if (!print) {
            return util::ConfigParseResult::Error("paymaster.printtoconsole must be a boolean");
        }
        out.printToConsole = *print;
    }

    return util::ConfigParseResult::Success();
}

// ============================================================================
// Paymaster
// ============================================================================

Paymaster::Paymaster(const PaymasterOptions& options,
                     std::shared_ptr<membership::IMembershipVerifier> verifier,
                     std::shared_ptr<IFundEscrow> escrow,
                     std::shared_ptr<IPolicy> policy)
    : options_(options),
      verifier_(std::move(verifier)),
      escrow_(RequireEscrow(std::move(escrow))),
      policy_(std::move(policy)),
      ledger_(escrow_),
      meter_(options.firstEpochTimestamp, options.epochDuration),
      settlement_(ledger_, &meter_) {
    if (!verifier_) {
        throw PaymasterError(PaymasterErrorCode::MissingCollaborator,
                             "Paymaster requires a membership verifier");
    }

    pipeline_ = std::make_unique<ValidationPipeline>(ledger_, CreateAuthorizer());

    auto& logger = util::Logger::Instance();
    if (options_.logLevel) {
        logger.SetLevel(*options_.logLevel);
    }
    if (options_.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = options_.logLevel.value_or(util::LogLevel::Info);
        consoleSink_ = std::make_shared<util::ConsoleSink>(consoleConfig);
        logger.AddSink(consoleSink_);
    }

    LOG_INFO(util::LogCategory::PAYMASTER) << "Paymaster started: variant="
                                           << PaymasterVariantToString(options_.variant)
                                           << " staleness="
                                           << StalenessPolicyToString(options_.stalenessPolicy);
}

Paymaster::~Paymaster() {
    if (consoleSink_) {
        util::Logger::Instance().RemoveSink(consoleSink_);
    }
}

std::unique_ptr<IProofAuthorizer> Paymaster::CreateAuthorizer() {
    switch (options_.variant) {
        case PaymasterVariant::Direct:
            return std::make_unique<DirectVerifyAuthorizer>(*verifier_);
        case PaymasterVariant::Cached: {
            auto authorizer = std::make_unique<CachedProofAuthorizer>(
                *verifier_, options_.stalenessPolicy);
            cachedAuthorizer_ = authorizer.get();
            return authorizer;
        }
        case PaymasterVariant::GasLimited:
            return std::make_unique<NullifierQuotaAuthorizer>(*verifier_, meter_);
        case PaymasterVariant::Policy:
            return std::make_unique<PolicyDelegateAuthorizer>(policy_, options_.selfAddress);
    }
    throw PaymasterError(PaymasterErrorCode::InvalidConfig, "Unknown paymaster variant");
}

void Paymaster::DepositForGroup(GroupId groupId, Amount amount) {
    ledger_.Deposit(groupId, amount);
}

void Paymaster::SetMaxGasPerUserPerEpoch(const Address& caller, GroupId groupId, Amount amount) {
    if (options_.variant != PaymasterVariant::GasLimited) {
        throw PaymasterError(PaymasterErrorCode::UnsupportedOperation,
                             "Gas quotas require the gaslimited variant");
    }

    auto admin = verifier_->GetGroupAdmin(groupId);
    if (!admin || *admin != caller) {
        LOG_WARN(util::LogCategory::PAYMASTER) << "Quota change for group " << groupId
                                               << " refused for " << caller.ToHex();
        throw PaymasterError(PaymasterErrorCode::Unauthorized,
                             "Only the group admin can set the gas quota");
    }

    meter_.SetQuota(groupId, amount);
}

bool Paymaster::AdvanceEpoch(Timestamp now) {
    return meter_.AdvanceEpoch(now);
}

ValidationResult Paymaster::ValidatePaymasterUserOp(const UserOperation& op,
                                                    Amount requiredPreFund) {
    return pipeline_->Validate(op, requiredPreFund);
}

void Paymaster::PostOp(const std::vector<Byte>& context, Amount actualCost) {
    settlement_.Settle(context, actualCost);
}

Amount Paymaster::GroupDeposits(GroupId groupId) const {
    return ledger_.GetBalance(groupId);
}

GasQuotaRecord Paymaster::GasData(const Uint256& nullifier) const {
    return meter_.GetRecord(nullifier);
}

EpochId Paymaster::CurrentEpoch() const {
    return meter_.GetCurrentEpoch();
}

Amount Paymaster::MaxGasPerUserPerEpoch(GroupId groupId) const {
    return meter_.GetQuota(groupId);
}

const ProofCache* Paymaster::GetProofCache() const {
    return cachedAuthorizer_ ? &cachedAuthorizer_->GetCache() : nullptr;
}

Paymaster::Stats Paymaster::GetStats() const {
    const auto& pipelineStats = pipeline_->GetStats();

    Stats stats{};
    stats.validated = pipelineStats.validated;
    stats.approved = pipelineStats.approved;
    stats.rejected = pipelineStats.validated - pipelineStats.approved;
    stats.settled = settlement_.GetSettledCount();
    stats.droppedSettlements = settlement_.GetDroppedCount();
    stats.totalDeposited = ledger_.GetTotalDeposited();
    stats.totalDebited = ledger_.GetTotalDebited();
    stats.ledgerUnderflows = ledger_.GetUnderflowCount();
    return stats;
}

} // namespace paymaster
} // namespace zkgas
