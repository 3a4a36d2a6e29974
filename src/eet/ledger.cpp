// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/ledger.h>
#include <util.h>

#include <limits>

namespace eet {

Ledger::Ledger()
    : totalSupply_(0)
{
}

CAmount Ledger::GetBalance(const Principal& account) const
{
    LOCK(cs_ledger_);

    auto it = balances_.find(account);
    if (it != balances_.end()) {
        return it->second;
    }
    return 0;
}

CAmount Ledger::GetTotalSupply() const
{
    LOCK(cs_ledger_);
    return totalSupply_;
}

size_t Ledger::GetHolderCount() const
{
    LOCK(cs_ledger_);
    return balances_.size();
}

void Ledger::SetBalance(const Principal& account, CAmount balance)
{
    if (balance == 0) {
        balances_.erase(account);
    } else {
        balances_[account] = balance;
    }
}

bool Ledger::CanCredit(const Principal& account, CAmount amount) const
{
    LOCK(cs_ledger_);

    if (amount <= 0) {
        return false;
    }
    return GetBalance(account) <= std::numeric_limits<CAmount>::max() - amount &&
           totalSupply_ <= std::numeric_limits<CAmount>::max() - amount;
}

bool Ledger::Credit(const Principal& account, CAmount amount)
{
    LOCK(cs_ledger_);

    if (amount <= 0) {
        return false;
    }

    if (!CanCredit(account, amount)) {
        return error("Ledger: credit of %d to %s would overflow", amount, PrincipalToLogString(account));
    }

    SetBalance(account, GetBalance(account) + amount);
    totalSupply_ += amount;
    return true;
}

bool Ledger::Debit(const Principal& account, CAmount amount)
{
    LOCK(cs_ledger_);

    CAmount balance = GetBalance(account);
    if (amount <= 0 || balance < amount) {
        return false;
    }

    SetBalance(account, balance - amount);
    totalSupply_ -= amount;
    return true;
}

OperationResult Ledger::Transfer(CAmount amount, const Principal& sender,
                                 const Principal& recipient, const Principal& caller)
{
    LOCK(cs_ledger_);

    if (caller != sender) {
        return OperationResult::Failure(LedgerError::AUTHORIZATION, "Caller is not the sender");
    }

    if (amount <= 0) {
        return OperationResult::Failure(LedgerError::VALIDATION, "Transfer amount must be greater than zero");
    }

    if (recipient == sender) {
        return OperationResult::Failure(LedgerError::VALIDATION, "Cannot transfer to self");
    }

    CAmount senderBalance = GetBalance(sender);
    if (senderBalance < amount) {
        return OperationResult::Failure(LedgerError::TRANSFER,
            strprintf("Insufficient balance for transfer (need %d, have %d)", amount, senderBalance));
    }

    // Recipient overflow cannot happen while sum(balances) == totalSupply,
    // since amount is already counted in totalSupply.
    SetBalance(sender, senderBalance - amount);
    SetBalance(recipient, GetBalance(recipient) + amount);

    LogPrint(BCLog::EET, "Ledger: %s sent %d to %s\n",
             PrincipalToLogString(sender), amount, PrincipalToLogString(recipient));

    return OperationResult::Success();
}

BurnResult Ledger::Burn(CAmount amount, const Principal& burner)
{
    LOCK(cs_ledger_);

    if (amount <= 0) {
        return BurnResult::Failure(LedgerError::VALIDATION, "Burn amount must be greater than zero");
    }

    CAmount balance = GetBalance(burner);
    if (balance < amount) {
        return BurnResult::Failure(LedgerError::TRANSFER,
            strprintf("Insufficient balance for burn (need %d, have %d)", amount, balance));
    }

    SetBalance(burner, balance - amount);
    totalSupply_ -= amount;

    LogPrint(BCLog::EET, "Ledger: %s burned %d, total supply %d\n",
             PrincipalToLogString(burner), amount, totalSupply_);

    return BurnResult::Success(amount);
}

bool Ledger::VerifySupplyInvariant() const
{
    LOCK(cs_ledger_);

    CAmount sumOfBalances = 0;
    for (const auto& entry : balances_) {
        if (entry.second < 0) {
            LogPrintf("Ledger: Negative balance %d for %s\n", entry.second, PrincipalToLogString(entry.first));
            return false;
        }
        sumOfBalances += entry.second;
    }

    if (sumOfBalances != totalSupply_) {
        LogPrintf("Ledger: Supply invariant violated - sumOfBalances (%d) != totalSupply (%d)\n",
                  sumOfBalances, totalSupply_);
        return false;
    }

    return true;
}

void Ledger::Clear()
{
    LOCK(cs_ledger_);

    balances_.clear();
    totalSupply_ = 0;
}

} // namespace eet
