// ZKGAS - Post-Operation Settlement Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/settlement.h"
#include "zkgas/paymaster/payload.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

SettlementHandler::SettlementHandler(GroupLedger& ledger, EpochGasMeter* meter)
    : ledger_(ledger), meter_(meter) {}

void SettlementHandler::Settle(const std::vector<Byte>& context, Amount actualCost) {
    if (!AmountRange(actualCost)) {
        ++dropped_;
        LogErrorF(util::LogCategory::PAYMASTER,
                  "Dropping settlement: cost %lld out of range",
                  static_cast<long long>(actualCost));
        return;
    }

    auto ctx = ValidationContext::Decode(context);
    if (!ctx) {
        ++dropped_;
        LogErrorF(util::LogCategory::PAYMASTER,
                  "Dropping settlement of %lld: undecodable context (%zu bytes)",
                  static_cast<long long>(actualCost), context.size());
        return;
    }

    ledger_.Debit(ctx->groupId, actualCost);

    if (ctx->kind == ContextKind::Nullifier) {
        if (meter_) {
            meter_->Record(ctx->nullifier, actualCost);
        } else {
            LOG_ERROR(util::LogCategory::PAYMASTER) << "Nullifier context without a gas meter;"
                                                    << " usage not recorded";
        }
    }

    ++settled_;
    LOG_DEBUG(util::LogCategory::PAYMASTER) << "Settled " << actualCost
                                            << " for group " << ctx->groupId;
}

} // namespace paymaster
} // namespace zkgas
