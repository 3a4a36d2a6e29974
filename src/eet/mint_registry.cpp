// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/mint_registry.h>
#include <util.h>

namespace eet {

MintRegistry::MintRegistry()
    : totalRecorded_(0)
{
}

bool MintRegistry::IsMinted(ProofId proofId) const
{
    LOCK(cs_registry_);
    return records_.count(proofId) > 0;
}

std::optional<MintRecord> MintRegistry::GetRecord(ProofId proofId) const
{
    LOCK(cs_registry_);

    auto it = records_.find(proofId);
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

CAmount MintRegistry::GetMinted(ProofId proofId) const
{
    LOCK(cs_registry_);

    auto it = records_.find(proofId);
    return it != records_.end() ? it->second.cumulativeMinted : 0;
}

CAmount MintRegistry::GetRemainingCapacity(ProofId proofId, CAmount excessOutput) const
{
    LOCK(cs_registry_);

    CAmount minted = GetMinted(proofId);
    if (excessOutput <= minted) {
        return 0;
    }
    return excessOutput - minted;
}

bool MintRegistry::RecordMint(ProofId proofId, CAmount amount, uint64_t height, CAmount excessOutput)
{
    LOCK(cs_registry_);

    if (amount <= 0) {
        return false;
    }

    // Double-spend prevention: capacity is cumulative over every mint
    if (GetRemainingCapacity(proofId, excessOutput) < amount) {
        return error("MintRegistry: mint of %d exceeds remaining capacity of proof %u", amount, proofId);
    }

    MintRecord& record = records_[proofId];
    record.cumulativeMinted += amount;
    record.lastMintHeight = height;
    totalRecorded_ += amount;

    LogPrint(BCLog::EET, "MintRegistry: proof %u minted %d/%d at height %u\n",
             proofId, record.cumulativeMinted, excessOutput, height);
    return true;
}

bool MintRegistry::RevertMint(ProofId proofId, CAmount amount, const std::optional<MintRecord>& previous)
{
    LOCK(cs_registry_);

    auto it = records_.find(proofId);
    if (amount <= 0 || it == records_.end() || it->second.cumulativeMinted < amount) {
        return false;
    }

    if (previous) {
        it->second = *previous;
    } else {
        records_.erase(it);
    }
    totalRecorded_ -= amount;
    return true;
}

size_t MintRegistry::GetRecordCount() const
{
    LOCK(cs_registry_);
    return records_.size();
}

CAmount MintRegistry::GetTotalRecorded() const
{
    LOCK(cs_registry_);
    return totalRecorded_;
}

std::map<ProofId, MintRecord> MintRegistry::GetAllRecords() const
{
    LOCK(cs_registry_);
    return records_;
}

void MintRegistry::Clear()
{
    LOCK(cs_registry_);

    records_.clear();
    totalRecorded_ = 0;
}

} // namespace eet
