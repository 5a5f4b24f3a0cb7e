// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_QF_ROUND_H
#define QFUND_QF_ROUND_H

#include "amount.h"
#include "optional.h"
#include "qf/qf_expiration.h"
#include "qf/qf_matching.h"
#include "qf/qf_validation_state.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Quadratic funding round
 *
 * One round = one budget, one proposal window, one voting window and a
 * single distribution once voting is over.
 *
 * LIFECYCLE:
 * 1. Instantiate: admin funds the budget and fixes the configuration
 * 2. CreateProposal: while the proposal period is open (whitelist optional)
 * 3. VoteProposal: while the voting period is open, one vote per
 *    (proposal, voter), funds in the budget denom
 * 4. TriggerDistribution: admin only, after the voting period, exactly once
 *
 * Every operation is atomic: on failure the round is unchanged.
 */

/** Amount of one denomination. */
struct Coin
{
    std::string denom;
    CAmount amount;

    Coin() : amount(0) {}
    Coin(const std::string& denomIn, const CAmount& amountIn) : denom(denomIn), amount(amountIn) {}

    bool operator==(const Coin& other) const { return denom == other.denom && amount == other.amount; }
    bool operator!=(const Coin& other) const { return !(*this == other); }

    std::string ToString() const { return FormatAmount(amount) + denom; }
};

/** Sender and attached funds of a round operation. */
struct MessageInfo
{
    std::string sender;
    std::vector<Coin> funds;

    MessageInfo() {}
    MessageInfo(const std::string& senderIn, const std::vector<Coin>& fundsIn) : sender(senderIn), funds(fundsIn) {}
};

/** Transfer emitted by a distribution. */
struct BankSend
{
    std::string to_address;
    Coin amount;

    BankSend() {}
    BankSend(const std::string& toIn, const Coin& amountIn) : to_address(toIn), amount(amountIn) {}

    bool operator==(const BankSend& other) const { return to_address == other.to_address && amount == other.amount; }
    bool operator!=(const BankSend& other) const { return !(*this == other); }
};

/**
 * Round instantiation message.
 *
 * The budget is not part of the message: it is the coin of budget_denom
 * sent along with it.
 */
struct QfInstantiateMsg
{
    std::string admin;
    std::string leftover_addr;                              // receives the distribution leftover
    Optional<std::vector<std::string>> create_proposal_whitelist;
    Optional<std::vector<std::string>> vote_proposal_whitelist;
    Expiration voting_period;
    Expiration proposal_period;
    std::string budget_denom;
    qf_matching::QuadraticFundingAlgorithm algorithm;
};

struct QfRoundConfig
{
    // single admin address; a multisig would sit behind it
    std::string admin;
    std::string leftover_addr;
    Optional<std::vector<std::string>> create_proposal_whitelist;
    Optional<std::vector<std::string>> vote_proposal_whitelist;
    Expiration voting_period;
    Expiration proposal_period;
    Coin budget;
    qf_matching::QuadraticFundingAlgorithm algorithm;
};

struct QfProposal
{
    uint64_t nId;
    std::string title;
    std::string description;
    Optional<std::string> metadata;
    std::string fund_address;
    CAmount collected_funds;

    QfProposal() : nId(0), collected_funds(0) {}

    bool operator==(const QfProposal& other) const
    {
        return nId == other.nId && title == other.title && description == other.description &&
               metadata == other.metadata && fund_address == other.fund_address &&
               collected_funds == other.collected_funds;
    }
};

struct QfVote
{
    uint64_t nProposalId;
    std::string voter;
    Coin fund;

    QfVote() : nProposalId(0) {}
};

/**
 * ExtractBudgetCoin - The single coin of `denom` attached to a message
 *
 * @param funds  Attached coins
 * @param denom  Expected denomination
 * @param coin   Output (untouched on failure)
 * @param state  WRONG_FUND_COIN if funds are empty, hold several coins,
 *               a foreign denom or a zero amount
 * @return true on success
 */
bool ExtractBudgetCoin(const std::vector<Coin>& funds,
                       const std::string& denom,
                       Coin& coin,
                       CQfValidationState& state);

class CQfRound
{
private:
    Optional<QfRoundConfig> m_config;

    // Ordered containers: iteration order defines the engine input order
    std::map<uint64_t, QfProposal> m_proposals;
    std::map<uint64_t, std::map<std::string, QfVote>> m_votes;  // proposal id -> voter -> vote

    uint64_t m_nProposalSeq;
    bool m_fDistributed;

    bool CheckInitialized(const char* func, CQfValidationState& state) const;

public:
    CQfRound() : m_nProposalSeq(0), m_fDistributed(false) {}

    /**
     * Instantiate - Configure the round (resets any previous state)
     *
     * Checks:
     * 1. proposal and voting periods not already expired
     * 2. admin, leftover address and whitelist entries non-empty
     * 3. exactly one non-zero coin of budget_denom attached (the budget)
     *
     * @param block  Current block
     * @param info   Sender (unused beyond logging) and budget funds
     * @param msg    Configuration
     * @param state  Validation state
     * @return true on success
     */
    bool Instantiate(const BlockInfo& block,
                     const MessageInfo& info,
                     const QfInstantiateMsg& msg,
                     CQfValidationState& state);

    /**
     * CreateProposal - Register a proposal
     *
     * Checks: create whitelist, proposal period, non-empty fund address.
     * Ids are sequential, starting at 1.
     *
     * @param[out] nIdOut  Id of the new proposal
     */
    bool CreateProposal(const BlockInfo& block,
                        const MessageInfo& info,
                        const std::string& title,
                        const std::string& description,
                        const Optional<std::string>& metadata,
                        const std::string& fund_address,
                        uint64_t& nIdOut,
                        CQfValidationState& state);

    /**
     * VoteProposal - Contribute the attached coin to a proposal
     *
     * Checks: vote whitelist, voting period, budget-denom coin, proposal
     * exists, sender has not voted on this proposal yet, collected funds
     * stay in range.
     */
    bool VoteProposal(const BlockInfo& block,
                      const MessageInfo& info,
                      uint64_t nProposalId,
                      CQfValidationState& state);

    /**
     * TriggerDistribution - Run the matching engine and emit transfers
     *
     * Admin only, after the voting period, once per round.
     * Emits one transfer of (grant + collected) per proposal in id order,
     * followed by the leftover transfer to leftover_addr (always emitted).
     *
     * @param[out] vSends  Transfers (untouched on failure)
     */
    bool TriggerDistribution(const BlockInfo& block,
                             const MessageInfo& info,
                             std::vector<BankSend>& vSends,
                             CQfValidationState& state);

    /**
     * BuildRawGrants - Snapshot proposals and votes as engine input
     *
     * Proposals by ascending id, funds by ascending voter address.
     */
    std::vector<qf_matching::RawGrant> BuildRawGrants() const;

    /**
     * CheckInvariants - Verify round bookkeeping
     *
     * RULES:
     * 1. collected_funds == sum of the proposal's vote funds
     * 2. every vote is in the budget denom and references its proposal
     *
     * @return true if all invariants hold
     */
    bool CheckInvariants() const;

    bool IsInitialized() const { return static_cast<bool>(m_config); }
    bool IsDistributed() const { return m_fDistributed; }

    bool GetConfig(QfRoundConfig& config) const;
    bool GetProposal(uint64_t nId, QfProposal& proposal) const;
    std::vector<QfProposal> GetAllProposals() const;
    std::vector<QfVote> GetVotes(uint64_t nProposalId) const;
};

#endif // QFUND_QF_ROUND_H
