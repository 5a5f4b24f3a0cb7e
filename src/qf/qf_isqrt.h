// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_QF_ISQRT_H
#define QFUND_QF_ISQRT_H

#include "amount.h"

namespace qf_math {

/**
 * IntegerSqrt - floor(sqrt(n)) over the full CAmount range
 *
 * CONSENSUS-CRITICAL: every validator must derive the same root, so no
 * floating point is involved anywhere.
 *
 * Newton iteration x' = (x + n/x) / 2 started from a power of two that is
 * strictly above sqrt(n) (taken from the most significant bit of n). The
 * sequence decreases monotonically and stops at floor(sqrt(n)).
 * Intermediates are held in CWideAmount so x + n/x cannot wrap even for
 * n = 2^128 - 1.
 *
 * @param n Radicand
 * @return Largest r such that r*r <= n
 */
CAmount IntegerSqrt(const CAmount& n);

/**
 * IsExactIntegerSqrt - Check r*r <= n < (r+1)*(r+1)
 *
 * @param n Radicand
 * @param r Candidate root
 * @return true if r == floor(sqrt(n))
 */
bool IsExactIntegerSqrt(const CAmount& n, const CAmount& r);

} // namespace qf_math

#endif // QFUND_QF_ISQRT_H
