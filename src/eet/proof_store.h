// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_PROOF_STORE_H
#define EET_PROOF_STORE_H

/**
 * @file proof_store.h
 * @brief Attested output claims consumed by the minter
 *
 * The attestation service is external to the ledger. The minter reads
 * proofs through the ProofStore interface and takes them at face value.
 * MemoryProofStore is an in-process store for hosts that receive
 * attestations directly, and for tests.
 */

#include <eet/eet_common.h>
#include <sync.h>

#include <map>
#include <optional>

namespace eet {

/**
 * @brief An attested claim of excess output by a producer
 */
struct Proof {
    /** Attested excess output (kWh); upper bound on tokens minted against this proof */
    CAmount excessOutput;

    /** Height at which the attestation was made */
    uint64_t attestedAt;

    /** Producer the claim belongs to; only this principal may mint against it */
    Principal producer;

    Proof() : excessOutput(0), attestedAt(0) {}

    Proof(CAmount output, uint64_t height, const Principal& producerIn)
        : excessOutput(output)
        , attestedAt(height)
        , producer(producerIn) {}

    bool operator==(const Proof& other) const {
        return excessOutput == other.excessOutput &&
               attestedAt == other.attestedAt &&
               producer == other.producer;
    }

    bool operator!=(const Proof& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Read access to attested proofs
 *
 * Implementations must be synchronous and side-effect free from the
 * ledger's point of view.
 */
class ProofStore {
public:
    virtual ~ProofStore() {}

    /**
     * @brief Look up a proof
     * @param proofId Proof identifier
     * @return The proof if attested, nullopt otherwise
     */
    virtual std::optional<Proof> GetProof(ProofId proofId) const = 0;
};

/**
 * @brief In-memory proof store
 *
 * Proofs are immutable once attested: AddProof refuses an id that is
 * already present.
 */
class MemoryProofStore : public ProofStore {
public:
    MemoryProofStore() {}

    std::optional<Proof> GetProof(ProofId proofId) const override;

    /**
     * @brief Record an attestation
     * @return false if a proof with this id already exists or the output is negative
     */
    bool AddProof(ProofId proofId, const Proof& proof);

    /**
     * @brief Withdraw an attestation
     * @return true if a proof was removed
     */
    bool RemoveProof(ProofId proofId);

    size_t GetProofCount() const;

    void Clear();

private:
    std::map<ProofId, Proof> proofs_;

    mutable CCriticalSection cs_proofs_;
};

} // namespace eet

#endif // EET_PROOF_STORE_H
