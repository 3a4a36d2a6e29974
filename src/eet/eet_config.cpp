// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/eet_config.h>
#include <eet/eet_params.h>
#include <util.h>
#include <utilstrencodings.h>

#include <stdexcept>

namespace eet {

std::string GetEETHelpMessage()
{
    const EETParams& defaults = MainnetEETParams();
    std::string strUsage;

    strUsage += HelpMessageGroup("Issuance options:");
    strUsage += HelpMessageOpt("-eetnetwork=<net>", strprintf("Parameter set to use: main, test or regtest (default: %s)", DEFAULT_EET_NETWORK));
    strUsage += HelpMessageOpt("-eetfeebps=<n>", strprintf("Issuance fee in basis points of the gross mint amount (default: %d)", defaults.nFeeBasisPoints));
    strUsage += HelpMessageOpt("-eetmaxsupply=<n>", strprintf("Maximum cumulative issuance in token units (default: %d)", defaults.nMaxSupply));
    strUsage += HelpMessageOpt("-eetmaxperproof=<n>", strprintf("Maximum net amount credited by a single mint (default: %d)", defaults.nMaxPerProof));
    strUsage += HelpMessageOpt("-eetexpiry=<n>", strprintf("Blocks after attestation during which a proof can back a mint (default: %u)", defaults.nProofExpiryBlocks));
    strUsage += HelpMessageOpt("-eethistorysize=<n>", strprintf("Mint history entries kept per account (default: %u)", defaults.nMaxHistoryEntries));
    strUsage += HelpMessageOpt("-eethistorypolicy=<policy>", strprintf("What to do when a mint history is full: reject or dropoldest (default: %s)",
                               HistoryOverflowPolicyToString(defaults.historyOverflowPolicy)));

    return strUsage;
}

static bool ParsePositiveAmountArg(const std::string& name, CAmount& value)
{
    if (!gArgs.IsArgSet(name)) return true;

    int64_t parsed = 0;
    std::string str = gArgs.GetArg(name, "");
    if (!ParseInt64(str, &parsed) || parsed <= 0) {
        return error("EET: Invalid %s value '%s'", name, str);
    }
    value = parsed;
    return true;
}

static bool ParseEETOverrides(EETParams& params)
{
    if (gArgs.IsArgSet("-eetfeebps")) {
        int64_t feeBps = 0;
        std::string str = gArgs.GetArg("-eetfeebps", "");
        if (!ParseInt64(str, &feeBps) || feeBps < 0) {
            return error("EET: Invalid -eetfeebps value '%s'", str);
        }
        params.nFeeBasisPoints = feeBps;
    }

    if (!ParsePositiveAmountArg("-eetmaxsupply", params.nMaxSupply)) return false;
    if (!ParsePositiveAmountArg("-eetmaxperproof", params.nMaxPerProof)) return false;

    if (gArgs.IsArgSet("-eetexpiry")) {
        uint64_t expiry = 0;
        std::string str = gArgs.GetArg("-eetexpiry", "");
        if (!ParseUInt64(str, &expiry)) {
            return error("EET: Invalid -eetexpiry value '%s'", str);
        }
        params.nProofExpiryBlocks = expiry;
    }

    if (gArgs.IsArgSet("-eethistorysize")) {
        uint64_t size = 0;
        std::string str = gArgs.GetArg("-eethistorysize", "");
        if (!ParseUInt64(str, &size) || size == 0) {
            return error("EET: Invalid -eethistorysize value '%s'", str);
        }
        params.nMaxHistoryEntries = size;
    }

    if (gArgs.IsArgSet("-eethistorypolicy")) {
        std::string str = gArgs.GetArg("-eethistorypolicy", "");
        if (!HistoryOverflowPolicyFromString(str, params.historyOverflowPolicy)) {
            return error("EET: Invalid -eethistorypolicy value '%s' (expected reject or dropoldest)", str);
        }
    }

    if (!params.IsValid()) {
        return error("EET: Inconsistent issuance parameters (fee %d bps, max supply %d, max per proof %d)",
                     params.nFeeBasisPoints, params.nMaxSupply, params.nMaxPerProof);
    }

    return true;
}

bool InitEETConfig()
{
    const EETParams previous = GetEETParams();

    std::string network = gArgs.GetArg("-eetnetwork", DEFAULT_EET_NETWORK);
    try {
        SelectEETParams(network);
    } catch (const std::runtime_error& e) {
        return error("EET: %s", e.what());
    }

    EETParams params = GetEETParams();
    if (!ParseEETOverrides(params)) {
        UpdateEETParams(previous);
        return false;
    }

    UpdateEETParams(params);

    LogPrintf("EET: network=%s fee=%dbps maxsupply=%d maxperproof=%d expiry=%u history=%u/%s\n",
              params.strNetworkID, params.nFeeBasisPoints, params.nMaxSupply, params.nMaxPerProof,
              params.nProofExpiryBlocks, params.nMaxHistoryEntries,
              HistoryOverflowPolicyToString(params.historyOverflowPolicy));

    return true;
}

} // namespace eet
