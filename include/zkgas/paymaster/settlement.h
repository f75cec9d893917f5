// ZKGAS - Post-Operation Settlement
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#ifndef ZKGAS_PAYMASTER_SETTLEMENT_H
#define ZKGAS_PAYMASTER_SETTLEMENT_H

#include <zkgas/core/types.h>
#include <zkgas/paymaster/gas_meter.h>
#include <zkgas/paymaster/ledger.h>

#include <cstdint>
#include <vector>

namespace zkgas {
namespace paymaster {

/**
 * Second phase of sponsorship: charge the real cost.
 *
 * Runs after the sponsored call has executed, so it cannot refuse. An
 * undecodable context, or a cost outside [0, MAX_AMOUNT], is logged and
 * dropped without touching any state.
 */
class SettlementHandler {
public:
    /// @param meter Gas meter for nullifier contexts; may be null
    SettlementHandler(GroupLedger& ledger, EpochGasMeter* meter);

    void Settle(const std::vector<Byte>& context, Amount actualCost);

    uint64_t GetSettledCount() const { return settled_; }
    uint64_t GetDroppedCount() const { return dropped_; }

private:
    GroupLedger& ledger_;
    EpochGasMeter* meter_;
    uint64_t settled_{0};
    uint64_t dropped_{0};
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_SETTLEMENT_H
