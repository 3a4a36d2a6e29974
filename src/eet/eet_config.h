// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_EET_CONFIG_H
#define EET_EET_CONFIG_H

/**
 * @file eet_config.h
 * @brief Ledger configuration from command-line style arguments
 *
 * Selects the network parameter set and applies per-parameter overrides
 * read from gArgs.
 */

#include <string>

namespace eet {

static const char* const DEFAULT_EET_NETWORK = "main";

/**
 * Get help message for the ledger's options
 * @return Help message string
 */
std::string GetEETHelpMessage();

/**
 * Initialize ledger parameters from gArgs
 * Selects -eetnetwork, then applies -eetfeebps, -eetmaxsupply,
 * -eetmaxperproof, -eetexpiry, -eethistorysize and -eethistorypolicy.
 * @return false (with the reason logged) if any value is invalid; the active
 *         parameters are left unchanged in that case
 */
bool InitEETConfig();

} // namespace eet

#endif // EET_EET_CONFIG_H
