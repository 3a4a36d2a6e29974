// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/mint_history.h>
#include <util.h>

#include <stdexcept>

namespace eet {

MintHistory::MintHistory(size_t capacity, HistoryOverflowPolicy policy)
    : capacity_(capacity)
    , policy_(policy)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("MintHistory: capacity must be positive");
    }
}

bool MintHistory::CanAppend(const Principal& account) const
{
    LOCK(cs_history_);

    if (policy_ == HistoryOverflowPolicy::DROP_OLDEST) {
        return true;
    }
    return GetSize(account) < capacity_;
}

bool MintHistory::Append(const Principal& account, ProofId proofId)
{
    LOCK(cs_history_);

    if (!CanAppend(account)) {
        LogPrint(BCLog::EET, "MintHistory: history of %s is full (%u entries)\n",
                 PrincipalToLogString(account), capacity_);
        return false;
    }

    std::deque<ProofId>& history = histories_[account];
    while (history.size() >= capacity_) {
        history.pop_front();
    }
    history.push_back(proofId);
    return true;
}

std::vector<ProofId> MintHistory::Get(const Principal& account) const
{
    LOCK(cs_history_);

    auto it = histories_.find(account);
    if (it == histories_.end()) {
        return std::vector<ProofId>();
    }
    return std::vector<ProofId>(it->second.begin(), it->second.end());
}

size_t MintHistory::GetSize(const Principal& account) const
{
    LOCK(cs_history_);

    auto it = histories_.find(account);
    return it != histories_.end() ? it->second.size() : 0;
}

void MintHistory::Clear()
{
    LOCK(cs_history_);
    histories_.clear();
}

} // namespace eet
