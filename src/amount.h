// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_AMOUNT_H
#define EET_AMOUNT_H

#include <stdint.h>

/** Amount in raw token units (can be negative in intermediate arithmetic) */
typedef int64_t CAmount;

/** One whole token: the token carries 6 decimals */
static const CAmount COIN = 1000000;

#endif // EET_AMOUNT_H
