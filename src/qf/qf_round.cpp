// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "qf/qf_round.h"

#include "logging.h"

#include <algorithm>

static bool IsWhitelisted(const Optional<std::vector<std::string>>& whitelist, const std::string& sender)
{
    if (!whitelist) {
        return true; // No whitelist: everyone allowed
    }
    return std::find(whitelist->begin(), whitelist->end(), sender) != whitelist->end();
}

static bool CheckWhitelistEntries(const Optional<std::vector<std::string>>& whitelist)
{
    if (!whitelist) {
        return true;
    }
    for (const std::string& addr : *whitelist) {
        if (addr.empty()) {
            return false;
        }
    }
    return true;
}

bool ExtractBudgetCoin(const std::vector<Coin>& funds,
                       const std::string& denom,
                       Coin& coin,
                       CQfValidationState& state)
{
    if (funds.empty()) {
        return state.Error(QfError::WRONG_FUND_COIN, "qf-no-funds",
                           "expected " + denom);
    }

    if (funds.size() != 1) {
        return state.Error(QfError::WRONG_FUND_COIN, "qf-multiple-coins",
                           "expected only " + denom + ", got " + std::to_string(funds.size()) + " coins");
    }

    if (funds[0].denom != denom) {
        return state.Error(QfError::WRONG_FUND_COIN, "qf-wrong-denom",
                           "expected " + denom + ", got " + funds[0].denom);
    }

    if (funds[0].amount == 0) {
        return state.Error(QfError::WRONG_FUND_COIN, "qf-zero-funds",
                           "expected non-zero " + denom);
    }

    coin = funds[0];
    return true;
}

// ============================================================================
// Round operations
// ============================================================================

bool CQfRound::CheckInitialized(const char* func, CQfValidationState& state) const
{
    if (!m_config) {
        LogPrintf("ERROR: %s: round not instantiated\n", func);
        return state.Error(QfError::INVALID_CONFIG, "qf-round-not-initialized");
    }
    return true;
}

bool CQfRound::Instantiate(const BlockInfo& block,
                           const MessageInfo& info,
                           const QfInstantiateMsg& msg,
                           CQfValidationState& state)
{
    // 1. Windows must still be open
    if (msg.proposal_period.IsExpired(block)) {
        return state.Error(QfError::PROPOSAL_PERIOD_EXPIRED, "qf-proposal-period-expired",
                           msg.proposal_period.ToString());
    }
    if (msg.voting_period.IsExpired(block)) {
        return state.Error(QfError::VOTING_PERIOD_EXPIRED, "qf-voting-period-expired",
                           msg.voting_period.ToString());
    }

    // 2. Addresses
    if (msg.admin.empty()) {
        return state.Error(QfError::INVALID_CONFIG, "qf-empty-admin");
    }
    if (msg.leftover_addr.empty()) {
        return state.Error(QfError::INVALID_CONFIG, "qf-empty-leftover-addr");
    }
    if (!CheckWhitelistEntries(msg.create_proposal_whitelist) ||
        !CheckWhitelistEntries(msg.vote_proposal_whitelist)) {
        return state.Error(QfError::INVALID_CONFIG, "qf-empty-whitelist-entry");
    }

    // 3. Budget
    Coin budget;
    if (!ExtractBudgetCoin(info.funds, msg.budget_denom, budget, state)) {
        LogPrintf("ERROR: %s: invalid budget funds: %s\n", __func__, state.ToString());
        return false;
    }

    QfRoundConfig config;
    config.admin = msg.admin;
    config.leftover_addr = msg.leftover_addr;
    config.create_proposal_whitelist = msg.create_proposal_whitelist;
    config.vote_proposal_whitelist = msg.vote_proposal_whitelist;
    config.voting_period = msg.voting_period;
    config.proposal_period = msg.proposal_period;
    config.budget = budget;
    config.algorithm = msg.algorithm;

    m_config = config;
    m_proposals.clear();
    m_votes.clear();
    m_nProposalSeq = 0;
    m_fDistributed = false;

    LogPrint(BCLog::ROUND, "Instantiate: sender=%s admin=%s budget=%s algorithm=%s proposal_period=%s voting_period=%s\n",
             info.sender, config.admin, config.budget.ToString(), qf_matching::GetAlgorithmName(config.algorithm),
             config.proposal_period.ToString(), config.voting_period.ToString());

    return true;
}

bool CQfRound::CreateProposal(const BlockInfo& block,
                              const MessageInfo& info,
                              const std::string& title,
                              const std::string& description,
                              const Optional<std::string>& metadata,
                              const std::string& fund_address,
                              uint64_t& nIdOut,
                              CQfValidationState& state)
{
    if (!CheckInitialized(__func__, state)) {
        return false;
    }

    // check whitelist
    if (!IsWhitelisted(m_config->create_proposal_whitelist, info.sender)) {
        return state.Error(QfError::UNAUTHORIZED, "qf-create-not-whitelisted", "sender=" + info.sender);
    }

    // check proposal expiration
    if (m_config->proposal_period.IsExpired(block)) {
        return state.Error(QfError::PROPOSAL_PERIOD_EXPIRED, "qf-proposal-period-expired",
                           m_config->proposal_period.ToString());
    }

    if (fund_address.empty()) {
        return state.Error(QfError::INVALID_CONFIG, "qf-empty-fund-address");
    }

    QfProposal proposal;
    proposal.nId = m_nProposalSeq + 1;
    proposal.title = title;
    proposal.description = description;
    proposal.metadata = metadata;
    proposal.fund_address = fund_address;
    proposal.collected_funds = 0;

    m_proposals[proposal.nId] = proposal;
    m_nProposalSeq = proposal.nId;
    nIdOut = proposal.nId;

    LogPrint(BCLog::ROUND, "CreateProposal: id=%u title=%s fund_address=%s sender=%s\n",
             proposal.nId, title, fund_address, info.sender);

    return true;
}

bool CQfRound::VoteProposal(const BlockInfo& block,
                            const MessageInfo& info,
                            uint64_t nProposalId,
                            CQfValidationState& state)
{
    if (!CheckInitialized(__func__, state)) {
        return false;
    }

    // check whitelist
    if (!IsWhitelisted(m_config->vote_proposal_whitelist, info.sender)) {
        return state.Error(QfError::UNAUTHORIZED, "qf-vote-not-whitelisted", "sender=" + info.sender);
    }

    // check voting expiration
    if (m_config->voting_period.IsExpired(block)) {
        return state.Error(QfError::VOTING_PERIOD_EXPIRED, "qf-voting-period-expired",
                           m_config->voting_period.ToString());
    }

    // sent funds must be the budget denom
    Coin fund;
    if (!ExtractBudgetCoin(info.funds, m_config->budget.denom, fund, state)) {
        return false;
    }

    auto it = m_proposals.find(nProposalId);
    if (it == m_proposals.end()) {
        return state.Error(QfError::PROPOSAL_NOT_FOUND, "qf-proposal-not-found",
                           "id=" + std::to_string(nProposalId));
    }

    auto itVotes = m_votes.find(nProposalId);
    if (itVotes != m_votes.end() && itVotes->second.count(info.sender)) {
        return state.Error(QfError::ALREADY_VOTED, "qf-already-voted",
                           "voter=" + info.sender + " id=" + std::to_string(nProposalId));
    }

    const CWideAmount newCollected = CWideAmount(it->second.collected_funds) + CWideAmount(fund.amount);
    if (!AmountRange(newCollected)) {
        LogPrintf("ERROR: %s: collected funds overflow (id=%u, collected=%s, fund=%s)\n",
                  __func__, nProposalId, it->second.collected_funds, fund.amount);
        return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-collected-overflow",
                           "id=" + std::to_string(nProposalId));
    }

    QfVote vote;
    vote.nProposalId = nProposalId;
    vote.voter = info.sender;
    vote.fund = fund;

    m_votes[nProposalId][info.sender] = vote;
    it->second.collected_funds = static_cast<CAmount>(newCollected);

    LogPrint(BCLog::ROUND, "VoteProposal: id=%u voter=%s fund=%s collected=%s\n",
             nProposalId, info.sender, fund.ToString(), it->second.collected_funds);

    return true;
}

std::vector<qf_matching::RawGrant> CQfRound::BuildRawGrants() const
{
    std::vector<qf_matching::RawGrant> vGrants;
    vGrants.reserve(m_proposals.size());

    for (const auto& proposalPair : m_proposals) {
        const QfProposal& proposal = proposalPair.second;

        qf_matching::RawGrant grant;
        grant.addr = proposal.fund_address;
        grant.collected_vote_funds = proposal.collected_funds;

        auto itVotes = m_votes.find(proposal.nId);
        if (itVotes != m_votes.end()) {
            grant.funds.reserve(itVotes->second.size());
            for (const auto& votePair : itVotes->second) {
                grant.funds.push_back(votePair.second.fund.amount);
            }
        }

        vGrants.push_back(grant);
    }

    return vGrants;
}

bool CQfRound::TriggerDistribution(const BlockInfo& block,
                                   const MessageInfo& info,
                                   std::vector<BankSend>& vSends,
                                   CQfValidationState& state)
{
    if (!CheckInitialized(__func__, state)) {
        return false;
    }

    // only admin can trigger distribution
    if (info.sender != m_config->admin) {
        return state.Error(QfError::UNAUTHORIZED, "qf-not-admin", "sender=" + info.sender);
    }

    // check voting period expiration
    if (!m_config->voting_period.IsExpired(block)) {
        return state.Error(QfError::VOTING_PERIOD_NOT_EXPIRED, "qf-voting-period-not-expired",
                           m_config->voting_period.ToString());
    }

    if (m_fDistributed) {
        return state.Error(QfError::ALREADY_DISTRIBUTED, "qf-already-distributed");
    }

    if (!CheckInvariants()) {
        return state.Error(QfError::INVALID_INPUT, "qf-round-invariants");
    }

    const std::vector<qf_matching::RawGrant> vGrants = BuildRawGrants();
    const std::string& denom = m_config->budget.denom;

    qf_matching::MatchingResult result;
    if (!qf_matching::CalculateMatching(m_config->algorithm, vGrants,
                                        Optional<CAmount>(m_config->budget.amount), result, state)) {
        LogPrintf("ERROR: %s: matching failed: %s\n", __func__, state.ToString());
        return false;
    }

    std::vector<BankSend> vMsgs;
    vMsgs.reserve(result.grants.size() + 1);

    for (const qf_matching::GrantMatch& match : result.grants) {
        // contributions are returned in full, matching is added on top
        const CWideAmount payout = CWideAmount(match.grant) + CWideAmount(match.collected_vote_funds);
        if (!AmountRange(payout)) {
            LogPrintf("ERROR: %s: payout overflow (addr=%s, grant=%s, collected=%s)\n",
                      __func__, match.addr, match.grant, match.collected_vote_funds);
            return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-payout-overflow", "addr=" + match.addr);
        }
        vMsgs.emplace_back(match.addr, Coin(denom, static_cast<CAmount>(payout)));
    }

    const CAmount leftover = result.leftover ? *result.leftover : CAmount(0);
    vMsgs.emplace_back(m_config->leftover_addr, Coin(denom, leftover));

    m_fDistributed = true;
    vSends.swap(vMsgs);

    LogPrint(BCLog::ROUND, "TriggerDistribution: height=%u proposals=%u leftover=%s -> %s\n",
             block.nHeight, vGrants.size(), leftover, m_config->leftover_addr);

    return true;
}

// ============================================================================
// Queries
// ============================================================================

bool CQfRound::CheckInvariants() const
{
    if (!m_config) {
        return true;
    }

    for (const auto& votesPair : m_votes) {
        if (!m_proposals.count(votesPair.first)) {
            LogPrintf("QF ROUND INVARIANT VIOLATION: votes for unknown proposal %u\n", votesPair.first);
            return false;
        }
    }

    for (const auto& proposalPair : m_proposals) {
        CWideAmount sum = 0;
        auto itVotes = m_votes.find(proposalPair.first);
        if (itVotes != m_votes.end()) {
            for (const auto& votePair : itVotes->second) {
                const QfVote& vote = votePair.second;
                if (vote.fund.denom != m_config->budget.denom || vote.nProposalId != proposalPair.first) {
                    LogPrintf("QF ROUND INVARIANT VIOLATION: bad vote %s on proposal %u\n",
                              vote.voter, proposalPair.first);
                    return false;
                }
                sum += CWideAmount(vote.fund.amount);
            }
        }

        if (sum != CWideAmount(proposalPair.second.collected_funds)) {
            LogPrintf("QF ROUND INVARIANT VIOLATION: proposal %u collected=%s votes=%s\n",
                      proposalPair.first, proposalPair.second.collected_funds, sum);
            return false;
        }
    }

    return true;
}

bool CQfRound::GetConfig(QfRoundConfig& config) const
{
    if (!m_config) {
        return false;
    }
    config = *m_config;
    return true;
}

bool CQfRound::GetProposal(uint64_t nId, QfProposal& proposal) const
{
    auto it = m_proposals.find(nId);
    if (it == m_proposals.end()) {
        return false;
    }
    proposal = it->second;
    return true;
}

std::vector<QfProposal> CQfRound::GetAllProposals() const
{
    std::vector<QfProposal> vProposals;
    vProposals.reserve(m_proposals.size());
    for (const auto& proposalPair : m_proposals) {
        vProposals.push_back(proposalPair.second);
    }
    return vProposals;
}

std::vector<QfVote> CQfRound::GetVotes(uint64_t nProposalId) const
{
    std::vector<QfVote> vVotes;
    auto it = m_votes.find(nProposalId);
    if (it != m_votes.end()) {
        for (const auto& votePair : it->second) {
            vVotes.push_back(votePair.second);
        }
    }
    return vVotes;
}
