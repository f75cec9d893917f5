// ZKGAS - Membership-Gated Paymaster
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Sponsors user operations for anonymous members of registered groups.
// A relayer drives each operation in two phases:
//
//   1. ValidatePaymasterUserOp - decide whether to sponsor; returns a context
//   2. PostOp                  - charge the real cost using that context
//
// The paymaster is not thread-safe; the host serializes all calls.

#ifndef ZKGAS_PAYMASTER_PAYMASTER_H
#define ZKGAS_PAYMASTER_PAYMASTER_H

#include <zkgas/core/types.h>
#include <zkgas/membership/verifier.h>
#include <zkgas/paymaster/errors.h>
#include <zkgas/paymaster/gas_meter.h>
#include <zkgas/paymaster/ledger.h>
#include <zkgas/paymaster/pipeline.h>
#include <zkgas/paymaster/policy.h>
#include <zkgas/paymaster/proof_cache.h>
#include <zkgas/paymaster/settlement.h>
#include <zkgas/paymaster/user_operation.h>
#include <zkgas/util/config.h>
#include <zkgas/util/logging.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkgas {
namespace paymaster {

// ============================================================================
// Options
// ============================================================================

enum class PaymasterVariant {
    /// Verify a full proof on every operation
    Direct,
    /// Verify once, then reuse a cached proof
    Cached,
    /// Epoch-scoped proofs with a per-nullifier gas quota
    GasLimited,
    /// Delegate the membership decision to an external policy
    Policy,
};

const char* PaymasterVariantToString(PaymasterVariant variant);

/// Parse "direct", "cached", "gaslimited" or "policy" (case-insensitive)
bool ParsePaymasterVariant(const std::string& str, PaymasterVariant& out);

/// Parse "pinned" or "aware" (case-insensitive)
bool ParseStalenessPolicy(const std::string& str, StalenessPolicy& out);

struct PaymasterOptions {
    PaymasterVariant variant = PaymasterVariant::Cached;
    StalenessPolicy stalenessPolicy = StalenessPolicy::RootPinned;

    /// Start of epoch 0
    Timestamp firstEpochTimestamp = 0;

    /// Epoch length in seconds
    int64_t epochDuration = 86400;

    /// Address the paymaster acts as when calling out (policy variant)
    Address selfAddress;

    /// Applied to the global logger on construction when set
    std::optional<util::LogLevel> logLevel;

    /// Attach a console sink to the global logger for the paymaster's lifetime
    bool printToConsole = false;

    /**
     * Read options from the [paymaster] section. Keys that are absent keep
     * the values already in `out`.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              PaymasterOptions& out);
};

// ============================================================================
// Paymaster
// ============================================================================

class Paymaster {
public:
    struct Stats {
        uint64_t validated;
        uint64_t approved;
        uint64_t rejected;
        uint64_t settled;
        uint64_t droppedSettlements;
        Amount totalDeposited;
        Amount totalDebited;
        uint64_t ledgerUnderflows;
    };

    /**
     * @param verifier Membership verifier (required)
     * @param escrow Receives forwarded deposits (required)
     * @param policy External policy (required for the policy variant)
     * @throws PaymasterError(MissingCollaborator) if a required collaborator is null
     * @throws PaymasterError(InvalidConfig) if the epoch duration is not positive
     */
    Paymaster(const PaymasterOptions& options,
              std::shared_ptr<membership::IMembershipVerifier> verifier,
              std::shared_ptr<IFundEscrow> escrow,
              std::shared_ptr<IPolicy> policy = nullptr);

    ~Paymaster();

    Paymaster(const Paymaster&) = delete;
    Paymaster& operator=(const Paymaster&) = delete;

    // --- Administration ---

    /// Prefund a group. Throws PaymasterError(ZeroAmount) for amount <= 0.
    void DepositForGroup(GroupId groupId, Amount amount);

    /**
     * Set the per-nullifier gas quota of a group.
     * @throws PaymasterError(UnsupportedOperation) unless the variant is GasLimited
     * @throws PaymasterError(Unauthorized) unless caller is the group admin
     * @throws PaymasterError(InvalidAmount) if amount is outside [0, MAX_AMOUNT]
     */
    void SetMaxGasPerUserPerEpoch(const Address& caller, GroupId groupId, Amount amount);

    /// Move to the epoch containing `now`; returns true if it changed
    bool AdvanceEpoch(Timestamp now);

    // --- Two-phase protocol ---

    ValidationResult ValidatePaymasterUserOp(const UserOperation& op, Amount requiredPreFund);

    void PostOp(const std::vector<Byte>& context, Amount actualCost);

    // --- Reads ---

    Amount GroupDeposits(GroupId groupId) const;

    GasQuotaRecord GasData(const Uint256& nullifier) const;

    EpochId CurrentEpoch() const;

    Amount MaxGasPerUserPerEpoch(GroupId groupId) const;

    /// Proof cache of the cached variant; null for other variants
    const ProofCache* GetProofCache() const;

    PaymasterVariant GetVariant() const { return options_.variant; }

    const PaymasterOptions& GetOptions() const { return options_; }

    Stats GetStats() const;

private:
    PaymasterOptions options_;
    std::shared_ptr<membership::IMembershipVerifier> verifier_;
    std::shared_ptr<IFundEscrow> escrow_;
    std::shared_ptr<IPolicy> policy_;

    GroupLedger ledger_;
    EpochGasMeter meter_;
    std::unique_ptr<ValidationPipeline> pipeline_;
    SettlementHandler settlement_;

    /// Added to the global logger when printToConsole is set; removed on destruction
    std::shared_ptr<util::ILogSink> consoleSink_;

    /// Owned by pipeline_; set for the cached variant only
    const CachedProofAuthorizer* cachedAuthorizer_{nullptr};

    std::unique_ptr<IProofAuthorizer> CreateAuthorizer();
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_PAYMASTER_H
