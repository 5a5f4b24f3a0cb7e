// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"

// 2^128 - 1 has 39 decimal digits
static const size_t MAX_AMOUNT_DIGITS = 39;

std::string FormatAmount(const CAmount& n)
{
    return n.str();
}

bool ParseAmount(const std::string& str, CAmount& nRet)
{
    if (str.empty() || str.size() > MAX_AMOUNT_DIGITS) {
        return false;
    }

    CWideAmount value = 0;
    for (const char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }

    if (!AmountRange(value)) {
        return false;
    }

    nRet = static_cast<CAmount>(value);
    return true;
}
