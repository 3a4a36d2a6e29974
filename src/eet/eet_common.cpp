// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/eet_common.h>

namespace eet {

std::string LedgerErrorString(LedgerError error)
{
    switch (error) {
        case LedgerError::NONE:          return "None";
        case LedgerError::AUTHORIZATION: return "AuthorizationError";
        case LedgerError::VALIDATION:    return "ValidationError";
        case LedgerError::PROOF:         return "ProofError";
        case LedgerError::SUPPLY:        return "SupplyError";
        case LedgerError::STATE:         return "StateError";
        case LedgerError::TRANSFER:      return "TransferError";
    }
    return "UnknownError";
}

std::string PrincipalToLogString(const Principal& principal)
{
    return principal.ToString().substr(0, 16);
}

} // namespace eet
