// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_QF_VALIDATION_STATE_H
#define QFUND_QF_VALIDATION_STATE_H

#include <string>

/**
 * Error taxonomy for the matching engine and the round orchestrator.
 *
 * Every error is fatal to the operation that raised it: the operation
 * returns false, its outputs are left untouched and no partial effects
 * are committed.
 */
enum class QfError {
    NONE,

    // Matching engine
    ARITHMETIC_OVERFLOW,        //!< sum, square or product outside CAmount
    UNSUPPORTED_ALGORITHM,      //!< algorithm tag not implemented
    INVALID_INPUT,              //!< grant's collected total != sum of its funds

    // Round orchestration
    UNAUTHORIZED,               //!< sender not admin / not whitelisted
    PROPOSAL_PERIOD_EXPIRED,
    VOTING_PERIOD_EXPIRED,
    VOTING_PERIOD_NOT_EXPIRED,
    PROPOSAL_NOT_FOUND,
    ALREADY_VOTED,              //!< one vote per (proposal, voter)
    WRONG_FUND_COIN,            //!< missing, zero or foreign-denom funds
    ALREADY_DISTRIBUTED,        //!< distribution is one-shot per round
    INVALID_CONFIG,
};

/** Stable CamelCase name of an error, used in logs and JSON errors. */
const char* QfErrorString(QfError error);

/** Capture information about failures in the engine and round operations. */
class CQfValidationState
{
private:
    QfError m_error{QfError::NONE};
    std::string m_reject_reason;
    std::string m_debug_message;

public:
    bool Error(QfError error,
               const std::string& reject_reason,
               const std::string& debug_message = "")
    {
        m_error = error;
        m_reject_reason = reject_reason;
        m_debug_message = debug_message;
        return false;
    }

    bool IsValid() const { return m_error == QfError::NONE; }
    bool IsError() const { return m_error != QfError::NONE; }
    QfError GetError() const { return m_error; }
    const std::string& GetRejectReason() const { return m_reject_reason; }
    const std::string& GetDebugMessage() const { return m_debug_message; }

    std::string ToString() const;
};

#endif // QFUND_QF_VALIDATION_STATE_H
