// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_LEDGER_H
#define EET_LEDGER_H

/**
 * @file ledger.h
 * @brief Account balances and total supply
 *
 * The Ledger owns the balance map and the total-supply counter and keeps
 * sum(balances) == totalSupply across every operation. Credit is only
 * reachable through the minter; transfers and burns validate their
 * inputs here and leave state untouched on any failure.
 */

#include <eet/eet_common.h>
#include <sync.h>

#include <map>

namespace eet {

class Ledger {
public:
    Ledger();

    /**
     * @brief Get balance for an account
     * @return Balance in token units (0 for unknown accounts)
     */
    CAmount GetBalance(const Principal& account) const;

    /** @return Current total supply */
    CAmount GetTotalSupply() const;

    /** @return Number of accounts holding a non-zero balance */
    size_t GetHolderCount() const;

    /**
     * @brief Add newly issued tokens to an account
     * @return false if amount is not positive or the balance would overflow
     *
     * Increases total supply by the same amount.
     */
    bool Credit(const Principal& account, CAmount amount);

    /** @return true if Credit(account, amount) would succeed */
    bool CanCredit(const Principal& account, CAmount amount) const;

    /**
     * @brief Take back tokens added by Credit
     * @return false, leaving the ledger unchanged, if amount is not positive
     *         or exceeds the account's balance
     *
     * Decreases total supply by the same amount.
     */
    bool Debit(const Principal& account, CAmount amount);

    /**
     * @brief Move tokens between accounts
     * @param amount Amount to move
     * @param sender Account debited
     * @param recipient Account credited
     * @param caller Principal issuing the transfer; must equal sender
     *
     * Checks, in order: caller is sender (AUTHORIZATION), amount > 0
     * (VALIDATION), recipient differs from sender (VALIDATION), sender
     * balance covers amount (TRANSFER).
     */
    OperationResult Transfer(CAmount amount, const Principal& sender,
                             const Principal& recipient, const Principal& caller);

    /**
     * @brief Destroy tokens held by the burner
     *
     * Checks amount > 0 (VALIDATION) and balance >= amount (TRANSFER).
     * Decreases total supply by the burned amount.
     */
    BurnResult Burn(CAmount amount, const Principal& burner);

    /**
     * @brief Recompute the sum of all balances and compare with total supply
     * @return true if sum(balances) == totalSupply and no balance is negative
     */
    bool VerifySupplyInvariant() const;

    /** @brief Clear all state (for testing) */
    void Clear();

private:
    /** Account -> balance; accounts with zero balance are not stored */
    std::map<Principal, CAmount> balances_;

    /** Total supply */
    CAmount totalSupply_;

    mutable CCriticalSection cs_ledger_;

    void SetBalance(const Principal& account, CAmount balance);
};

} // namespace eet

#endif // EET_LEDGER_H
