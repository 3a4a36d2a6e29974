// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/minter.h>
#include <util.h>

#include <stdexcept>

namespace eet {

CAmount CalculateMintFee(CAmount amount, CAmount feeBasisPoints)
{
    // Split the product so amount * bps cannot overflow for large amounts
    return (amount / BASIS_POINTS_DENOMINATOR) * feeBasisPoints +
           (amount % BASIS_POINTS_DENOMINATOR) * feeBasisPoints / BASIS_POINTS_DENOMINATOR;
}

Minter::Minter(const EETParams& params,
               ConfigStore& config,
               Ledger& ledger,
               MintRegistry& registry,
               MintHistory& history,
               const ProofStore& proofs,
               const ProducerRegistry& producers,
               SettlementRail& rail)
    : params_(params)
    , config_(config)
    , ledger_(ledger)
    , registry_(registry)
    , history_(history)
    , proofs_(proofs)
    , producers_(producers)
    , rail_(rail)
    , currentHeight_(0)
    , totalMinted_(0)
{
    if (!params_.IsValid()) {
        throw std::invalid_argument("Minter: invalid issuance parameters for " + params_.strNetworkID);
    }
    if (history_.GetCapacity() != params_.nMaxHistoryEntries ||
        history_.GetPolicy() != params_.historyOverflowPolicy) {
        throw std::invalid_argument(strprintf("Minter: mint history (%u, %s) does not match parameters (%u, %s)",
            history_.GetCapacity(), HistoryOverflowPolicyToString(history_.GetPolicy()),
            params_.nMaxHistoryEntries, HistoryOverflowPolicyToString(params_.historyOverflowPolicy)));
    }
}

MintResult Minter::RejectMint(LedgerError code, const std::string& message, ProofId proofId,
                              const Principal& caller) const
{
    LogPrint(BCLog::EET, "Minter: mint against proof %u by %s rejected (%s): %s\n",
             proofId, PrincipalToLogString(caller), LedgerErrorString(code), message);
    return MintResult::Failure(code, message);
}

MintResult Minter::Mint(CAmount amount, ProofId proofId, const Principal& caller)
{
    LOCK(cs_minter_);

    if (config_.IsPaused()) {
        return RejectMint(LedgerError::STATE, "Ledger is paused", proofId, caller);
    }

    if (!producers_.IsRegistered(caller)) {
        return RejectMint(LedgerError::AUTHORIZATION, "Caller is not a registered producer", proofId, caller);
    }

    std::optional<Proof> proof = proofs_.GetProof(proofId);
    if (!proof) {
        return RejectMint(LedgerError::PROOF, "Proof does not exist", proofId, caller);
    }

    const CAmount fee = CalculateMintFee(amount, params_.nFeeBasisPoints);
    const CAmount net = amount - fee;
    const uint64_t height = currentHeight_;

    // Insufficient proof: every condition below maps to the same error
    if (proof->producer != caller) {
        return RejectMint(LedgerError::PROOF, "Insufficient proof: caller is not the proof's producer", proofId, caller);
    }
    if (net <= 0) {
        return RejectMint(LedgerError::PROOF, "Insufficient proof: net amount must be positive", proofId, caller);
    }
    if (net > params_.nMaxPerProof) {
        return RejectMint(LedgerError::PROOF,
            strprintf("Insufficient proof: net amount %d exceeds per-proof limit %d", net, params_.nMaxPerProof),
            proofId, caller);
    }
    if (proof->attestedAt > height) {
        return RejectMint(LedgerError::PROOF, "Insufficient proof: attested after current height", proofId, caller);
    }
    if (height - proof->attestedAt > params_.nProofExpiryBlocks) {
        return RejectMint(LedgerError::PROOF,
            strprintf("Insufficient proof: expired (attested at %u, height %u)", proof->attestedAt, height),
            proofId, caller);
    }
    if (registry_.GetRemainingCapacity(proofId, proof->excessOutput) < net) {
        return RejectMint(LedgerError::PROOF,
            strprintf("Insufficient proof: remaining capacity %d below %d",
                      registry_.GetRemainingCapacity(proofId, proof->excessOutput), net),
            proofId, caller);
    }

    if (totalMinted_ > params_.nMaxSupply - net) {
        return RejectMint(LedgerError::SUPPLY,
            strprintf("Mint of %d would exceed max supply %d", net, params_.nMaxSupply),
            proofId, caller);
    }

    if (!history_.CanAppend(caller)) {
        return RejectMint(LedgerError::VALIDATION, "Mint history is full", proofId, caller);
    }

    if (!ledger_.CanCredit(caller, net)) {
        return RejectMint(LedgerError::VALIDATION, "Credit would overflow the minter's balance", proofId, caller);
    }

    const Principal feeRecipient = config_.GetFeeRecipient();
    if (fee > 0 && !rail_.Transfer(fee, caller, feeRecipient)) {
        return RejectMint(LedgerError::TRANSFER, "Fee settlement failed", proofId, caller);
    }

    // The checks above hold unless a store was modified outside the Minter
    // while the fee was settled; undo whatever was applied in that case.
    const std::optional<MintRecord> previousRecord = registry_.GetRecord(proofId);
    if (!ledger_.Credit(caller, net)) {
        RollbackMint(net, fee, proofId, caller, feeRecipient, false, false, previousRecord);
        return RejectMint(LedgerError::VALIDATION, "Credit would overflow the minter's balance", proofId, caller);
    }
    if (!registry_.RecordMint(proofId, net, height, proof->excessOutput)) {
        RollbackMint(net, fee, proofId, caller, feeRecipient, true, false, previousRecord);
        return RejectMint(LedgerError::PROOF, "Insufficient proof: remaining capacity changed", proofId, caller);
    }
    if (!history_.Append(caller, proofId)) {
        RollbackMint(net, fee, proofId, caller, feeRecipient, true, true, previousRecord);
        return RejectMint(LedgerError::VALIDATION, "Mint history is full", proofId, caller);
    }
    totalMinted_ += net;

    LogPrint(BCLog::EET, "Minter: %s minted %d (fee %d) against proof %u at height %u\n",
             PrincipalToLogString(caller), net, fee, proofId, height);

    EmitMintEvent(MintEvent(net, fee, proofId, caller, height));

    return MintResult::Success(net, fee);
}

void Minter::RollbackMint(CAmount net, CAmount fee, ProofId proofId, const Principal& caller,
                          const Principal& feeRecipient, bool credited, bool recorded,
                          const std::optional<MintRecord>& previousRecord)
{
    if (recorded && !registry_.RevertMint(proofId, net, previousRecord)) {
        error("Minter: failed to revert mint record of proof %u", proofId);
    }
    if (credited && !ledger_.Debit(caller, net)) {
        error("Minter: failed to take back credit of %d from %s", net, PrincipalToLogString(caller));
    }
    if (fee > 0 && !rail_.Transfer(fee, feeRecipient, caller)) {
        error("Minter: failed to refund fee of %d for proof %u to %s", fee, proofId, PrincipalToLogString(caller));
    }
    LogPrintf("Minter: rolled back mint of %d against proof %u by %s\n",
              net, proofId, PrincipalToLogString(caller));
}

BurnResult Minter::Burn(CAmount amount, const Principal& caller)
{
    LOCK(cs_minter_);

    if (config_.IsPaused()) {
        LogPrint(BCLog::EET, "Minter: burn by %s rejected, ledger is paused\n", PrincipalToLogString(caller));
        return BurnResult::Failure(LedgerError::STATE, "Ledger is paused");
    }

    BurnResult result = ledger_.Burn(amount, caller);
    if (!result.success) {
        LogPrint(BCLog::EET, "Minter: burn by %s rejected: %s\n", PrincipalToLogString(caller), result.errorMessage);
        return result;
    }

    EmitBurnEvent(BurnEvent(amount, caller, currentHeight_));
    return result;
}

OperationResult Minter::Transfer(CAmount amount, const Principal& sender,
                                 const Principal& recipient, const Principal& caller)
{
    LOCK(cs_minter_);

    if (config_.IsPaused()) {
        LogPrint(BCLog::EET, "Minter: transfer from %s rejected, ledger is paused\n", PrincipalToLogString(sender));
        return OperationResult::Failure(LedgerError::STATE, "Ledger is paused");
    }

    OperationResult result = ledger_.Transfer(amount, sender, recipient, caller);
    if (!result.success) {
        LogPrint(BCLog::EET, "Minter: transfer from %s rejected: %s\n", PrincipalToLogString(sender), result.errorMessage);
        return result;
    }

    EmitTransferEvent(TransferEvent(amount, sender, recipient, currentHeight_));
    return result;
}

void Minter::SetCurrentHeight(uint64_t height)
{
    LOCK(cs_minter_);
    currentHeight_ = height;
}

uint64_t Minter::GetCurrentHeight() const
{
    LOCK(cs_minter_);
    return currentHeight_;
}

CAmount Minter::GetBalance(const Principal& account) const
{
    return ledger_.GetBalance(account);
}

CAmount Minter::GetTotalSupply() const
{
    return ledger_.GetTotalSupply();
}

CAmount Minter::GetTotalMinted() const
{
    LOCK(cs_minter_);
    return totalMinted_;
}

OperationResult Minter::GetMintableAmount(ProofId proofId, CAmount& mintable) const
{
    LOCK(cs_minter_);

    std::optional<Proof> proof = proofs_.GetProof(proofId);
    if (!proof) {
        return OperationResult::Failure(LedgerError::PROOF, "Proof does not exist");
    }

    mintable = registry_.GetRemainingCapacity(proofId, proof->excessOutput);
    return OperationResult::Success();
}

bool Minter::IsProofMinted(ProofId proofId) const
{
    return registry_.IsMinted(proofId);
}

std::optional<MintRecord> Minter::GetMintRecord(ProofId proofId) const
{
    return registry_.GetRecord(proofId);
}

std::vector<ProofId> Minter::GetMintHistory(const Principal& account) const
{
    return history_.Get(account);
}

bool Minter::IsPaused() const
{
    return config_.IsPaused();
}

Principal Minter::GetOwner() const
{
    return config_.GetOwner();
}

bool Minter::VerifySupplyInvariant() const
{
    LOCK(cs_minter_);

    if (!ledger_.VerifySupplyInvariant()) {
        return false;
    }

    CAmount supply = ledger_.GetTotalSupply();
    if (supply > params_.nMaxSupply || totalMinted_ > params_.nMaxSupply) {
        LogPrintf("Minter: Supply cap violated - totalSupply (%d), totalMinted (%d), cap (%d)\n",
                  supply, totalMinted_, params_.nMaxSupply);
        return false;
    }

    if (supply > totalMinted_) {
        LogPrintf("Minter: totalSupply (%d) exceeds totalMinted (%d)\n", supply, totalMinted_);
        return false;
    }

    return true;
}

void Minter::RegisterMintEventCallback(MintEventCallback callback)
{
    LOCK(cs_minter_);
    mintEventCallbacks_.push_back(std::move(callback));
}

void Minter::RegisterBurnEventCallback(BurnEventCallback callback)
{
    LOCK(cs_minter_);
    burnEventCallbacks_.push_back(std::move(callback));
}

void Minter::RegisterTransferEventCallback(TransferEventCallback callback)
{
    LOCK(cs_minter_);
    transferEventCallbacks_.push_back(std::move(callback));
}

std::vector<MintEvent> Minter::GetMintEvents() const
{
    LOCK(cs_minter_);
    return mintEvents_;
}

std::vector<MintEvent> Minter::GetMintEventsForMinter(const Principal& minter) const
{
    LOCK(cs_minter_);

    std::vector<MintEvent> result;
    for (const auto& event : mintEvents_) {
        if (event.minter == minter) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<BurnEvent> Minter::GetBurnEvents() const
{
    LOCK(cs_minter_);
    return burnEvents_;
}

std::vector<TransferEvent> Minter::GetTransferEvents() const
{
    LOCK(cs_minter_);
    return transferEvents_;
}

void Minter::EmitMintEvent(const MintEvent& event)
{
    mintEvents_.push_back(event);

    // Callbacks may register further callbacks
    const std::vector<MintEventCallback> callbacks = mintEventCallbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LogPrintf("Minter: Exception in mint event callback: %s\n", e.what());
        }
    }
}

void Minter::EmitBurnEvent(const BurnEvent& event)
{
    burnEvents_.push_back(event);

    // Callbacks may register further callbacks
    const std::vector<BurnEventCallback> callbacks = burnEventCallbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LogPrintf("Minter: Exception in burn event callback: %s\n", e.what());
        }
    }
}

void Minter::EmitTransferEvent(const TransferEvent& event)
{
    transferEvents_.push_back(event);

    // Callbacks may register further callbacks
    const std::vector<TransferEventCallback> callbacks = transferEventCallbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            LogPrintf("Minter: Exception in transfer event callback: %s\n", e.what());
        }
    }
}

} // namespace eet
