// ZKGAS - Group Fund Ledger
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Per-group prepaid balances. Deposits are forwarded to the external escrow
// that actually pays for sponsored calls; the ledger is pure accounting.

#ifndef ZKGAS_PAYMASTER_LEDGER_H
#define ZKGAS_PAYMASTER_LEDGER_H

#include <zkgas/core/types.h>

#include <cstdint>
#include <map>
#include <memory>

namespace zkgas {
namespace paymaster {

// ============================================================================
// Escrow
// ============================================================================

/// External fund escrow / stake holder
class IFundEscrow {
public:
    virtual ~IFundEscrow() = default;

    /// Credit `amount` to the paymaster's escrowed deposit
    virtual void DepositTo(Amount amount) = 0;

    /// Total currently escrowed
    virtual Amount GetDeposit() const = 0;
};

/// Escrow that only keeps a running total
class InMemoryEscrow : public IFundEscrow {
public:
    void DepositTo(Amount amount) override { total_ += amount; }
    Amount GetDeposit() const override { return total_; }

private:
    Amount total_{0};
};

// ============================================================================
// Group Ledger
// ============================================================================

class GroupLedger {
public:
    explicit GroupLedger(std::shared_ptr<IFundEscrow> escrow);

    /// Credit a group and forward the funds to the escrow.
    /// Throws PaymasterError(ZeroAmount) if amount <= 0, and
    /// PaymasterError(InvalidAmount) if amount is out of range or the group
    /// balance or deposit total would exceed MAX_AMOUNT.
    void Deposit(GroupId groupId, Amount amount);

    bool HasSufficientBalance(GroupId groupId, Amount requiredAmount) const;

    /// Unconditional debit; the balance may go negative
    void Debit(GroupId groupId, Amount amount);

    Amount GetBalance(GroupId groupId) const;

    Amount GetTotalDeposited() const { return totalDeposited_; }
    Amount GetTotalDebited() const { return totalDebited_; }

    /// Number of debits that left a group below zero
    uint64_t GetUnderflowCount() const { return underflows_; }

private:
    std::shared_ptr<IFundEscrow> escrow_;
    std::map<GroupId, Amount> balances_;
    Amount totalDeposited_{0};
    Amount totalDebited_{0};
    uint64_t underflows_{0};
};

} // namespace paymaster
} // namespace zkgas

#endif // ZKGAS_PAYMASTER_LEDGER_H
