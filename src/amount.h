// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_AMOUNT_H
#define QFUND_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>
#include <string>

/**
 * Amount in the smallest unit of the round's single denomination.
 *
 * Unsigned 128-bit, wide enough for any on-chain token supply.
 * Arithmetic on CAmount wraps silently: every sum, square or product that
 * can leave the range MUST be computed in CWideAmount and range-checked
 * before narrowing back.
 */
typedef boost::multiprecision::uint128_t CAmount;

/** Widened intermediate: holds the product of any two CAmount values. */
typedef boost::multiprecision::uint256_t CWideAmount;

static const CAmount MAX_AMOUNT = std::numeric_limits<CAmount>::max();

inline bool AmountRange(const CWideAmount& nValue) { return nValue <= CWideAmount(MAX_AMOUNT); }

/** Decimal representation, no separators, no unit. */
std::string FormatAmount(const CAmount& n);

/**
 * Parse a non-negative decimal integer amount.
 *
 * Accepts only [0-9]+ (no sign, whitespace, fraction or exponent) and
 * rejects values above MAX_AMOUNT.
 *
 * @param str   Input string
 * @param nRet  Output amount (untouched on failure)
 * @return true on success
 */
bool ParseAmount(const std::string& str, CAmount& nRet);

#endif // QFUND_AMOUNT_H
