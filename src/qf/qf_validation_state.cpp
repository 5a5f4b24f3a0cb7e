// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "qf/qf_validation_state.h"

const char* QfErrorString(QfError error)
{
    switch (error) {
    case QfError::NONE:                      return "None";
    case QfError::ARITHMETIC_OVERFLOW:       return "ArithmeticOverflow";
    case QfError::UNSUPPORTED_ALGORITHM:     return "UnsupportedAlgorithm";
    case QfError::INVALID_INPUT:             return "InvalidInput";
    case QfError::UNAUTHORIZED:              return "Unauthorized";
    case QfError::PROPOSAL_PERIOD_EXPIRED:   return "ProposalPeriodExpired";
    case QfError::VOTING_PERIOD_EXPIRED:     return "VotingPeriodExpired";
    case QfError::VOTING_PERIOD_NOT_EXPIRED: return "VotingPeriodNotExpired";
    case QfError::PROPOSAL_NOT_FOUND:        return "ProposalNotFound";
    case QfError::ALREADY_VOTED:             return "AddressAlreadyVotedProject";
    case QfError::WRONG_FUND_COIN:           return "WrongFundCoin";
    case QfError::ALREADY_DISTRIBUTED:       return "AlreadyDistributed";
    case QfError::INVALID_CONFIG:            return "InvalidConfig";
    } // no default case, so the compiler can warn about missing cases
    return "Unknown";
}

std::string CQfValidationState::ToString() const
{
    if (IsValid()) {
        return "Valid";
    }

    std::string str = std::string(QfErrorString(m_error)) + ": " + m_reject_reason;
    if (!m_debug_message.empty()) {
        str += ", " + m_debug_message;
    }
    return str;
}
