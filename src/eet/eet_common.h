// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_EET_COMMON_H
#define EET_EET_COMMON_H

/**
 * @file eet_common.h
 * @brief Shared types for the Excess Energy Token ledger
 *
 * Principal and proof identifiers, the error taxonomy shared by every
 * mutating operation, result structures, and the static token metadata.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <string>

namespace eet {

/** A caller identity: owner, producer, holder, fee recipient */
typedef uint160 Principal;

/** Identifier of an attested proof in the ProofStore */
typedef uint64_t ProofId;

// ============================================================================
// Token metadata
// ============================================================================

static const char* const TOKEN_NAME = "ExcessEnergyToken";
static const char* const TOKEN_SYMBOL = "EET";
static constexpr uint8_t TOKEN_DECIMALS = 6;
static const char* const TOKEN_URI = "https://example.com/eet-metadata.json";

/** Fee rates are expressed in basis points of the gross mint amount */
static constexpr CAmount BASIS_POINTS_DENOMINATOR = 10000;

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Reason an operation was rejected
 *
 * Every rejection leaves ledger state untouched.
 */
enum class LedgerError : uint8_t {
    NONE = 0,
    /** Caller lacks the role or ownership the operation requires */
    AUTHORIZATION,
    /** Malformed, zero or out-of-range input, self-transfer, self-ownership-transfer */
    VALIDATION,
    /** Proof missing, expired, not owned by caller, or capacity exhausted */
    PROOF,
    /** Mint would exceed the maximum supply */
    SUPPLY,
    /** Operation blocked because the ledger is paused */
    STATE,
    /** Insufficient balance, or the fee settlement rail refused the transfer */
    TRANSFER
};

/** Human readable name of an error code ("AuthorizationError", ...) */
std::string LedgerErrorString(LedgerError error);

/**
 * @brief Result of an administrative command or a transfer
 */
struct OperationResult {
    /** Whether the operation succeeded */
    bool success;

    /** Error code if failed */
    LedgerError error;

    /** Error message if failed */
    std::string errorMessage;

    OperationResult() : success(false), error(LedgerError::NONE) {}

    static OperationResult Success() {
        OperationResult result;
        result.success = true;
        return result;
    }

    static OperationResult Failure(LedgerError code, const std::string& message) {
        OperationResult result;
        result.success = false;
        result.error = code;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Result of a mint operation
 */
struct MintResult {
    bool success;
    LedgerError error;
    std::string errorMessage;

    /** Tokens credited to the minter (gross amount minus fee) */
    CAmount netAmount;

    /** Fee moved to the fee recipient over the settlement rail */
    CAmount fee;

    MintResult() : success(false), error(LedgerError::NONE), netAmount(0), fee(0) {}

    static MintResult Success(CAmount net, CAmount feeAmount) {
        MintResult result;
        result.success = true;
        result.netAmount = net;
        result.fee = feeAmount;
        return result;
    }

    static MintResult Failure(LedgerError code, const std::string& message) {
        MintResult result;
        result.success = false;
        result.error = code;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Result of a burn operation
 */
struct BurnResult {
    bool success;
    LedgerError error;
    std::string errorMessage;

    /** Amount removed from the burner's balance and from total supply */
    CAmount amountBurned;

    BurnResult() : success(false), error(LedgerError::NONE), amountBurned(0) {}

    static BurnResult Success(CAmount amount) {
        BurnResult result;
        result.success = true;
        result.amountBurned = amount;
        return result;
    }

    static BurnResult Failure(LedgerError code, const std::string& message) {
        BurnResult result;
        result.success = false;
        result.error = code;
        result.errorMessage = message;
        return result;
    }
};

/** Short form of a principal for log lines */
std::string PrincipalToLogString(const Principal& principal);

} // namespace eet

#endif // EET_EET_COMMON_H
