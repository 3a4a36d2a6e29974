// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_MINTER_H
#define EET_MINTER_H

/**
 * @file minter.h
 * @brief Proof-gated issuance of Excess Energy Tokens
 *
 * The Minter is the single entry point for every balance-affecting
 * operation. A mint converts part of an attested proof of excess output
 * into tokens credited to the producer, after skimming an issuance fee
 * that is settled to the fee recipient over an external rail. It ensures:
 * - cumulative issuance per proof never exceeds the proof's output
 * - cumulative issuance never exceeds the supply cap
 * - total supply equals the sum of all balances
 * - nothing changes when an operation is rejected
 *
 * Thread-safe; operations are applied one at a time.
 */

#include <eet/config_store.h>
#include <eet/eet_common.h>
#include <eet/eet_params.h>
#include <eet/ledger.h>
#include <eet/mint_history.h>
#include <eet/mint_registry.h>
#include <eet/producer_registry.h>
#include <eet/proof_store.h>
#include <eet/settlement.h>
#include <amount.h>
#include <sync.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace eet {

// ============================================================================
// Events
// ============================================================================

/**
 * @brief Event emitted when tokens are minted against a proof
 */
struct MintEvent {
    /** Tokens credited to the minter */
    CAmount netAmount;

    /** Fee settled to the fee recipient */
    CAmount fee;

    ProofId proofId;

    Principal minter;

    /** Height at which the mint was applied */
    uint64_t height;

    MintEvent() : netAmount(0), fee(0), proofId(0), height(0) {}

    MintEvent(CAmount net, CAmount feeAmount, ProofId id, const Principal& who, uint64_t h)
        : netAmount(net), fee(feeAmount), proofId(id), minter(who), height(h) {}
};

/** Event emitted when tokens are burned */
struct BurnEvent {
    CAmount amount;
    Principal burner;
    uint64_t height;

    BurnEvent() : amount(0), height(0) {}

    BurnEvent(CAmount amt, const Principal& who, uint64_t h)
        : amount(amt), burner(who), height(h) {}
};

/** Event emitted when tokens move between accounts */
struct TransferEvent {
    CAmount amount;
    Principal from;
    Principal to;
    uint64_t height;

    TransferEvent() : amount(0), height(0) {}

    TransferEvent(CAmount amt, const Principal& sender, const Principal& recipient, uint64_t h)
        : amount(amt), from(sender), to(recipient), height(h) {}
};

// ============================================================================
// Fee arithmetic
// ============================================================================

/**
 * @brief Issuance fee for a gross amount
 * @return floor(amount * feeBasisPoints / 10000), computed without
 *         intermediate overflow for any non-negative amount
 */
CAmount CalculateMintFee(CAmount amount, CAmount feeBasisPoints);

// ============================================================================
// Minter
// ============================================================================

class Minter {
public:
    using MintEventCallback = std::function<void(const MintEvent&)>;
    using BurnEventCallback = std::function<void(const BurnEvent&)>;
    using TransferEventCallback = std::function<void(const TransferEvent&)>;

    /**
     * @brief Construct a Minter over its state stores and collaborators
     * @param params Issuance parameters (copied)
     * @param config Administrative configuration (pause flag, fee recipient)
     * @param ledger Balances and total supply
     * @param registry Per-proof issuance records
     * @param history Per-account audit trail
     * @param proofs Attested proofs
     * @param producers Registered producers
     * @param rail Settlement rail used for the issuance fee
     * @throws std::invalid_argument if params are invalid or the history's
     *         capacity or overflow policy differ from params
     */
    Minter(const EETParams& params,
           ConfigStore& config,
           Ledger& ledger,
           MintRegistry& registry,
           MintHistory& history,
           const ProofStore& proofs,
           const ProducerRegistry& producers,
           SettlementRail& rail);

    /**
     * @brief Mint tokens against an attested proof
     * @param amount Gross amount requested; the fee is taken out of it
     * @param proofId Proof backing the mint
     * @param caller Producer requesting the mint
     * @return MintResult carrying the net amount credited and the fee
     *
     * Checks, in order: ledger not paused (STATE), caller registered
     * (AUTHORIZATION), proof exists (PROOF), proof owned by caller with a
     * positive net within the per-proof limit, attested no later than the
     * current height and not expired, with enough remaining capacity
     * (PROOF), supply cap (SUPPLY), history room (VALIDATION), fee
     * settlement (TRANSFER). Nothing changes unless every check passes.
     */
    MintResult Mint(CAmount amount, ProofId proofId, const Principal& caller);

    /**
     * @brief Destroy tokens from the caller's balance
     *
     * Burning never frees capacity on the proof the tokens were minted
     * against, and does not reduce the cumulative minted total.
     */
    BurnResult Burn(CAmount amount, const Principal& caller);

    /**
     * @brief Move tokens between accounts; only the sender may initiate
     */
    OperationResult Transfer(CAmount amount, const Principal& sender,
                             const Principal& recipient, const Principal& caller);

    /** @brief Set the height used for expiry checks and events */
    void SetCurrentHeight(uint64_t height);

    uint64_t GetCurrentHeight() const;

    // Read accessors

    CAmount GetBalance(const Principal& account) const;

    CAmount GetTotalSupply() const;

    /** @return Cumulative net issuance; burns do not reduce it */
    CAmount GetTotalMinted() const;

    std::string GetName() const { return TOKEN_NAME; }
    std::string GetSymbol() const { return TOKEN_SYMBOL; }
    uint8_t GetDecimals() const { return TOKEN_DECIMALS; }
    std::string GetTokenUri() const { return TOKEN_URI; }

    /**
     * @brief Remaining capacity of a proof
     * @param proofId Proof to query
     * @param[out] mintable max(0, excessOutput - cumulativeMinted)
     * @return PROOF failure if the proof does not exist
     */
    OperationResult GetMintableAmount(ProofId proofId, CAmount& mintable) const;

    bool IsProofMinted(ProofId proofId) const;

    std::optional<MintRecord> GetMintRecord(ProofId proofId) const;

    std::vector<ProofId> GetMintHistory(const Principal& account) const;

    bool IsPaused() const;

    Principal GetOwner() const;

    /**
     * @brief Verify the supply invariants
     * @return true if the sum of balances equals total supply and neither
     *         total supply nor cumulative issuance exceed the cap
     */
    bool VerifySupplyInvariant() const;

    const EETParams& GetParams() const { return params_; }

    // Events

    void RegisterMintEventCallback(MintEventCallback callback);
    void RegisterBurnEventCallback(BurnEventCallback callback);
    void RegisterTransferEventCallback(TransferEventCallback callback);

    std::vector<MintEvent> GetMintEvents() const;

    /** @return Mint events of one minter, oldest first */
    std::vector<MintEvent> GetMintEventsForMinter(const Principal& minter) const;

    std::vector<BurnEvent> GetBurnEvents() const;
    std::vector<TransferEvent> GetTransferEvents() const;

private:
    /** Fill a mint rejection, logging it under the eet category */
    MintResult RejectMint(LedgerError code, const std::string& message, ProofId proofId,
                          const Principal& caller) const;

    /**
     * Undo a mint whose apply step failed part way: restore the proof's
     * record if it was written, take back the credit if it was made, and
     * refund the fee over the rail.
     */
    void RollbackMint(CAmount net, CAmount fee, ProofId proofId, const Principal& caller,
                      const Principal& feeRecipient, bool credited, bool recorded,
                      const std::optional<MintRecord>& previousRecord);

    void EmitMintEvent(const MintEvent& event);
    void EmitBurnEvent(const BurnEvent& event);
    void EmitTransferEvent(const TransferEvent& event);

    const EETParams params_;

    ConfigStore& config_;
    Ledger& ledger_;
    MintRegistry& registry_;
    MintHistory& history_;
    const ProofStore& proofs_;
    const ProducerRegistry& producers_;
    SettlementRail& rail_;

    uint64_t currentHeight_;

    CAmount totalMinted_;

    std::vector<MintEvent> mintEvents_;
    std::vector<BurnEvent> burnEvents_;
    std::vector<TransferEvent> transferEvents_;

    std::vector<MintEventCallback> mintEventCallbacks_;
    std::vector<BurnEventCallback> burnEventCallbacks_;
    std::vector<TransferEventCallback> transferEventCallbacks_;

    mutable CCriticalSection cs_minter_;
};

} // namespace eet

#endif // EET_MINTER_H
