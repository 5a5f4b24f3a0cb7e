// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_QF_EXPIRATION_H
#define QFUND_QF_EXPIRATION_H

#include <stdint.h>
#include <string>

/** Block at which a round operation executes. */
struct BlockInfo
{
    uint64_t nHeight;
    uint64_t nTime;     // seconds since epoch

    BlockInfo() : nHeight(0), nTime(0) {}
    BlockInfo(uint64_t nHeightIn, uint64_t nTimeIn) : nHeight(nHeightIn), nTime(nTimeIn) {}
};

/**
 * Expiration - Deadline of a round window
 *
 * - AtHeight(h): expired once block height >= h
 * - AtTime(t):   expired once block time >= t
 * - Never:       never expires (default)
 */
class Expiration
{
public:
    enum class Type {
        NEVER,
        AT_HEIGHT,
        AT_TIME,
    };

    Expiration() : m_type(Type::NEVER), m_value(0) {}

    static Expiration AtHeight(uint64_t nHeight) { return Expiration(Type::AT_HEIGHT, nHeight); }
    static Expiration AtTime(uint64_t nTime) { return Expiration(Type::AT_TIME, nTime); }
    static Expiration Never() { return Expiration(); }

    Type GetType() const { return m_type; }
    uint64_t GetValue() const { return m_value; }

    bool IsExpired(const BlockInfo& block) const;

    std::string ToString() const;

    bool operator==(const Expiration& other) const { return m_type == other.m_type && m_value == other.m_value; }
    bool operator!=(const Expiration& other) const { return !(*this == other); }

private:
    Expiration(Type type, uint64_t value) : m_type(type), m_value(value) {}

    Type m_type;
    uint64_t m_value;
};

#endif // QFUND_QF_EXPIRATION_H
