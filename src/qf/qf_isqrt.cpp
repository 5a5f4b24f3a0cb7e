// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "qf/qf_isqrt.h"

namespace qf_math {

CAmount IntegerSqrt(const CAmount& n)
{
    if (n < 2) {
        return n;
    }

    // n < 2^(msb+1), so sqrt(n) < 2^(msb/2 + 1)
    const unsigned shift = boost::multiprecision::msb(n) / 2 + 1;
    const CWideAmount wide_n(n);

    CWideAmount x = CWideAmount(1) << shift;
    CWideAmount y = (x + wide_n / x) >> 1;

    while (y < x) {
        x = y;
        y = (x + wide_n / x) >> 1;
    }

    // x <= 2^64 here, narrowing is exact
    return static_cast<CAmount>(x);
}

bool IsExactIntegerSqrt(const CAmount& n, const CAmount& r)
{
    const CWideAmount wide_r(r);
    const CWideAmount wide_n(n);

    if (wide_r * wide_r > wide_n) {
        return false;
    }

    return (wide_r + 1) * (wide_r + 1) > wide_n;
}

} // namespace qf_math
