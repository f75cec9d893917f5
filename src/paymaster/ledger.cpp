// ZKGAS - Group Fund Ledger Implementation
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include "zkgas/paymaster/ledger.h"
#include "zkgas/paymaster/errors.h"
#include "zkgas/util/logging.h"

namespace zkgas {
namespace paymaster {

GroupLedger::GroupLedger(std::shared_ptr<IFundEscrow> escrow)
    : escrow_(std::move(escrow)) {
    if (!escrow_) {
        throw PaymasterError(PaymasterErrorCode::MissingCollaborator,
                             "GroupLedger requires a fund escrow");
    }
}

void GroupLedger::Deposit(GroupId groupId, Amount amount) {
    if (amount <= 0) {
        throw PaymasterError(PaymasterErrorCode::ZeroAmount,
                             "Must deposit non-zero amount");
    }
    if (!AmountRange(amount)) {
        throw PaymasterError(PaymasterErrorCode::InvalidAmount,
                             "Deposit amount out of range");
    }
    if (GetBalance(groupId) > MAX_AMOUNT - amount ||
        totalDeposited_ > MAX_AMOUNT - amount) {
        throw PaymasterError(PaymasterErrorCode::InvalidAmount,
                             "Deposit would exceed MAX_AMOUNT");
    }

    escrow_->DepositTo(amount);
    balances_[groupId] += amount;
    totalDeposited_ += amount;

    LOG_INFO(util::LogCategory::LEDGER) << "Deposit group=" << groupId
                                        << " amount=" << amount
                                        << " balance=" << balances_[groupId];
}

bool GroupLedger::HasSufficientBalance(GroupId groupId, Amount requiredAmount) const {
    return GetBalance(groupId) >= requiredAmount;
}

void GroupLedger::Debit(GroupId groupId, Amount amount) {
    Amount& balance = balances_[groupId];
    balance -= amount;
    totalDebited_ += amount;

    if (balance < 0) {
        ++underflows_;
        LogWarnF(util::LogCategory::LEDGER,
                 "Group %llu balance below zero after debit of %lld: %lld",
                 static_cast<unsigned long long>(groupId),
                 static_cast<long long>(amount),
                 static_cast<long long>(balance));
    }
}

Amount GroupLedger::GetBalance(GroupId groupId) const {
    auto it = balances_.find(groupId);
    return it == balances_.end() ? 0 : it->second;
}

} // namespace paymaster
} // namespace zkgas
