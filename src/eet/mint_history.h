// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_MINT_HISTORY_H
#define EET_MINT_HISTORY_H

/**
 * @file mint_history.h
 * @brief Append-only per-account audit trail of consumed proofs
 *
 * Each account keeps the ordered list of proof ids it has minted
 * against. The list is bounded; when it is full the configured
 * HistoryOverflowPolicy either refuses the append or evicts the oldest
 * entry.
 */

#include <eet/eet_common.h>
#include <eet/eet_params.h>
#include <sync.h>

#include <deque>
#include <map>
#include <vector>

namespace eet {

class MintHistory {
public:
    /**
     * @param capacity Maximum entries per account (must be positive)
     * @param policy Behaviour when an account's history is full
     */
    MintHistory(size_t capacity, HistoryOverflowPolicy policy);

    /**
     * @brief Check whether Append would succeed for the account
     */
    bool CanAppend(const Principal& account) const;

    /**
     * @brief Append a proof id to the account's history
     * @return false, leaving the history unchanged, if the history is
     *         full and the policy is REJECT
     */
    bool Append(const Principal& account, ProofId proofId);

    /**
     * @brief Get the account's history, oldest first
     * @return Empty vector if the account never minted
     */
    std::vector<ProofId> Get(const Principal& account) const;

    /** @return Number of entries held for the account */
    size_t GetSize(const Principal& account) const;

    size_t GetCapacity() const { return capacity_; }

    HistoryOverflowPolicy GetPolicy() const { return policy_; }

    /** @brief Clear all histories (for testing) */
    void Clear();

private:
    const size_t capacity_;

    const HistoryOverflowPolicy policy_;

    std::map<Principal, std::deque<ProofId>> histories_;

    mutable CCriticalSection cs_history_;
};

} // namespace eet

#endif // EET_MINT_HISTORY_H
