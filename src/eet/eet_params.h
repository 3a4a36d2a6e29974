// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_EET_PARAMS_H
#define EET_EET_PARAMS_H

/**
 * @file eet_params.h
 * @brief Issuance parameters for the ledger
 *
 * These parameters control the issuance fee, the supply cap, the per-proof
 * mint limit, proof expiry and the per-account mint history bound.
 * They are network-specific (main/test/regtest).
 */

#include <amount.h>

#include <cstdint>
#include <string>

namespace eet {

/** What happens when an account's mint history is full */
enum class HistoryOverflowPolicy : uint8_t {
    /** Refuse the mint that would overflow the history */
    REJECT = 0,
    /** Evict the oldest entry to make room */
    DROP_OLDEST = 1
};

/** "reject" / "dropoldest" */
std::string HistoryOverflowPolicyToString(HistoryOverflowPolicy policy);

/** Parse "reject" / "dropoldest"; returns false on anything else */
bool HistoryOverflowPolicyFromString(const std::string& str, HistoryOverflowPolicy& policy);

struct EETParams {
    /** Network name this parameter set belongs to */
    std::string strNetworkID;

    /** Issuance fee in basis points of the gross mint amount (100 = 1%) */
    CAmount nFeeBasisPoints;

    /** Hard cap on cumulative issuance */
    CAmount nMaxSupply;

    /** Largest net amount a single mint may credit */
    CAmount nMaxPerProof;

    /** Blocks after attestation during which a proof may back a mint */
    uint64_t nProofExpiryBlocks;

    /** Entries retained per account in the mint history */
    size_t nMaxHistoryEntries;

    /** Behaviour when the mint history is full */
    HistoryOverflowPolicy historyOverflowPolicy;

    /** Check internal consistency of the parameter set */
    bool IsValid() const;
};

/**
 * Get parameters for mainnet
 */
const EETParams& MainnetEETParams();

/**
 * Get parameters for testnet
 */
const EETParams& TestnetEETParams();

/**
 * Get parameters for regtest
 * Note: Regtest uses a reduced supply cap so cap behaviour is cheap to exercise
 */
const EETParams& RegtestEETParams();

/**
 * Get parameters for the selected network
 */
const EETParams& GetEETParams();

/**
 * Select parameters by network name ("main", "test", "regtest")
 * @throws std::runtime_error for an unknown network
 */
void SelectEETParams(const std::string& network);

/**
 * Replace the active parameter set; used by configuration overrides
 */
void UpdateEETParams(const EETParams& params);

} // namespace eet

#endif // EET_EET_PARAMS_H
