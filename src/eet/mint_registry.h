// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_MINT_REGISTRY_H
#define EET_MINT_REGISTRY_H

/**
 * @file mint_registry.h
 * @brief Per-proof issuance tracking
 *
 * The MintRegistry records how much has been minted against every proof
 * so that the cumulative amount never exceeds the proof's attested
 * output. Records are created on the first mint against a proof and are
 * never deleted; burns do not free capacity.
 */

#include <eet/eet_common.h>
#include <sync.h>

#include <map>
#include <optional>
#include <vector>

namespace eet {

/**
 * @brief Issuance recorded against a single proof
 */
struct MintRecord {
    /** Net tokens minted against the proof so far */
    CAmount cumulativeMinted;

    /** Height of the most recent mint against the proof */
    uint64_t lastMintHeight;

    MintRecord() : cumulativeMinted(0), lastMintHeight(0) {}

    MintRecord(CAmount minted, uint64_t height)
        : cumulativeMinted(minted), lastMintHeight(height) {}

    bool operator==(const MintRecord& other) const {
        return cumulativeMinted == other.cumulativeMinted &&
               lastMintHeight == other.lastMintHeight;
    }

    bool operator!=(const MintRecord& other) const {
        return !(*this == other);
    }
};

class MintRegistry {
public:
    MintRegistry();

    /**
     * @brief Check whether any tokens were minted against a proof
     */
    bool IsMinted(ProofId proofId) const;

    /**
     * @brief Get the record for a proof
     * @return The record if the proof has been minted against, nullopt otherwise
     */
    std::optional<MintRecord> GetRecord(ProofId proofId) const;

    /** @return Cumulative amount minted against the proof (0 if never minted) */
    CAmount GetMinted(ProofId proofId) const;

    /**
     * @brief Remaining capacity of a proof
     * @param proofId Proof identifier
     * @param excessOutput Attested output of the proof
     * @return max(0, excessOutput - cumulativeMinted)
     */
    CAmount GetRemainingCapacity(ProofId proofId, CAmount excessOutput) const;

    /**
     * @brief Record a mint against a proof
     * @param proofId Proof identifier
     * @param amount Net amount minted (must be positive)
     * @param height Height of the mint
     * @param excessOutput Attested output of the proof
     * @return false, leaving the record unchanged, if the amount is not
     *         positive or would take the cumulative total past excessOutput
     */
    bool RecordMint(ProofId proofId, CAmount amount, uint64_t height, CAmount excessOutput);

    /**
     * @brief Undo a RecordMint
     * @param proofId Proof identifier
     * @param amount Amount passed to the RecordMint being undone
     * @param previous Record of the proof before that RecordMint, nullopt if
     *        the proof had none
     * @return false, leaving the record unchanged, if less than amount is
     *         recorded against the proof
     */
    bool RevertMint(ProofId proofId, CAmount amount, const std::optional<MintRecord>& previous);

    /** @return Number of proofs with a record */
    size_t GetRecordCount() const;

    /** @return Total minted across all proofs */
    CAmount GetTotalRecorded() const;

    /** @return All records keyed by proof id (for testing/debugging) */
    std::map<ProofId, MintRecord> GetAllRecords() const;

    /** @brief Clear all records (for testing) */
    void Clear();

private:
    std::map<ProofId, MintRecord> records_;

    CAmount totalRecorded_;

    mutable CCriticalSection cs_registry_;
};

} // namespace eet

#endif // EET_MINT_REGISTRY_H
