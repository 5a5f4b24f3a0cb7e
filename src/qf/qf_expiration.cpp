// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "qf/qf_expiration.h"

bool Expiration::IsExpired(const BlockInfo& block) const
{
    switch (m_type) {
    case Type::AT_HEIGHT:
        return block.nHeight >= m_value;
    case Type::AT_TIME:
        return block.nTime >= m_value;
    case Type::NEVER:
        return false;
    }
    return false;
}

std::string Expiration::ToString() const
{
    switch (m_type) {
    case Type::AT_HEIGHT:
        return "expiration{height=" + std::to_string(m_value) + "}";
    case Type::AT_TIME:
        return "expiration{time=" + std::to_string(m_value) + "}";
    case Type::NEVER:
        return "expiration{never}";
    }
    return "expiration{unknown}";
}
