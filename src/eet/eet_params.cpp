// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/eet_params.h>
#include <eet/eet_common.h>
#include <util.h>

#include <stdexcept>

namespace eet {

std::string HistoryOverflowPolicyToString(HistoryOverflowPolicy policy)
{
    switch (policy) {
        case HistoryOverflowPolicy::REJECT:      return "reject";
        case HistoryOverflowPolicy::DROP_OLDEST: return "dropoldest";
    }
    return "unknown";
}

bool HistoryOverflowPolicyFromString(const std::string& str, HistoryOverflowPolicy& policy)
{
    if (str == "reject") {
        policy = HistoryOverflowPolicy::REJECT;
        return true;
    }
    if (str == "dropoldest") {
        policy = HistoryOverflowPolicy::DROP_OLDEST;
        return true;
    }
    return false;
}

bool EETParams::IsValid() const
{
    return nFeeBasisPoints >= 0 &&
           nFeeBasisPoints < BASIS_POINTS_DENOMINATOR &&
           nMaxSupply > 0 &&
           nMaxPerProof > 0 &&
           nMaxPerProof <= nMaxSupply &&
           nMaxHistoryEntries > 0;
}

static EETParams MakeParams(const std::string& network, CAmount maxSupply)
{
    EETParams params;
    params.strNetworkID = network;
    params.nFeeBasisPoints = 100;                       // 1%
    params.nMaxSupply = maxSupply;
    params.nMaxPerProof = 1000000;
    params.nProofExpiryBlocks = 144;                    // ~1 day of blocks
    params.nMaxHistoryEntries = 100;
    params.historyOverflowPolicy = HistoryOverflowPolicy::REJECT;
    return params;
}

// Mainnet parameters
static const EETParams mainnetEETParams = MakeParams("main", 1000000000000LL);

// Testnet parameters (same economics as main)
static const EETParams testnetEETParams = MakeParams("test", 1000000000000LL);

// Regtest parameters (small cap)
static const EETParams regtestEETParams = MakeParams("regtest", 5000000);

static EETParams currentEETParams = mainnetEETParams;

const EETParams& MainnetEETParams()
{
    return mainnetEETParams;
}

const EETParams& TestnetEETParams()
{
    return testnetEETParams;
}

const EETParams& RegtestEETParams()
{
    return regtestEETParams;
}

const EETParams& GetEETParams()
{
    return currentEETParams;
}

void SelectEETParams(const std::string& network)
{
    if (network == "main") {
        currentEETParams = mainnetEETParams;
    } else if (network == "test") {
        currentEETParams = testnetEETParams;
    } else if (network == "regtest") {
        currentEETParams = regtestEETParams;
    } else {
        throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
    }
    LogPrint(BCLog::CONFIG, "EET: Selected %s parameters\n", network);
}

void UpdateEETParams(const EETParams& params)
{
    currentEETParams = params;
}

} // namespace eet
