// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef EET_UTILSTRENCODINGS_H
#define EET_UTILSTRENCODINGS_H

#include <stdint.h>
#include <string>
#include <vector>

static const char HEX_CHARS[] = "0123456789abcdef";

signed char HexDigit(char c);
bool IsHex(const std::string& str);
std::string HexStr(const std::vector<unsigned char>& vch);

int64_t atoi64(const std::string& str);

/**
 * Convert string to signed 64-bit integer with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid integer,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseInt64(const std::string& str, int64_t *out);

/**
 * Convert decimal string to unsigned 64-bit integer with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid integer,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseUInt64(const std::string& str, uint64_t *out);

#endif // EET_UTILSTRENCODINGS_H
