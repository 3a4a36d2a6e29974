// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/proof_store.h>
#include <util.h>

namespace eet {

std::optional<Proof> MemoryProofStore::GetProof(ProofId proofId) const
{
    LOCK(cs_proofs_);

    auto it = proofs_.find(proofId);
    if (it != proofs_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryProofStore::AddProof(ProofId proofId, const Proof& proof)
{
    LOCK(cs_proofs_);

    if (proof.excessOutput < 0) {
        return error("MemoryProofStore: negative output %d for proof %u", proof.excessOutput, proofId);
    }

    if (!proofs_.emplace(proofId, proof).second) {
        LogPrint(BCLog::EET, "MemoryProofStore: proof %u already attested\n", proofId);
        return false;
    }

    LogPrint(BCLog::EET, "MemoryProofStore: attested proof %u (%d kWh at height %u for %s)\n",
             proofId, proof.excessOutput, proof.attestedAt, PrincipalToLogString(proof.producer));
    return true;
}

bool MemoryProofStore::RemoveProof(ProofId proofId)
{
    LOCK(cs_proofs_);
    return proofs_.erase(proofId) > 0;
}

size_t MemoryProofStore::GetProofCount() const
{
    LOCK(cs_proofs_);
    return proofs_.size();
}

void MemoryProofStore::Clear()
{
    LOCK(cs_proofs_);
    proofs_.clear();
}

} // namespace eet
