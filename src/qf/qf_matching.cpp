// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "qf/qf_matching.h"

#include "logging.h"
#include "qf/qf_isqrt.h"

#include <utility>

namespace qf_matching {

// ============================================================================
// Algorithm dispatch
// ============================================================================

namespace {

class AlgorithmNameVisitor : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const CapitalConstrainedLiberalRadicalism&) const
    {
        return ALGORITHM_CLR_NAME;
    }
};

class AlgorithmParameterVisitor : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const CapitalConstrainedLiberalRadicalism& algo) const
    {
        return algo.parameter;
    }
};

class MatchingVisitor : public boost::static_visitor<bool>
{
private:
    const std::vector<RawGrant>& m_grants;
    const Optional<CAmount>& m_budget;
    MatchingResult& m_result;
    CQfValidationState& m_state;

public:
    MatchingVisitor(const std::vector<RawGrant>& grants,
                    const Optional<CAmount>& budget,
                    MatchingResult& result,
                    CQfValidationState& state)
        : m_grants(grants), m_budget(budget), m_result(result), m_state(state) {}

    bool operator()(const CapitalConstrainedLiberalRadicalism&) const
    {
        // Reserved parameter is not an input of the formula
        return CalculateClr(m_grants, m_budget, m_result, m_state);
    }
};

std::string BudgetToString(const Optional<CAmount>& budget)
{
    return budget ? FormatAmount(*budget) : std::string("unconstrained");
}

} // namespace

std::string GetAlgorithmName(const QuadraticFundingAlgorithm& algorithm)
{
    return boost::apply_visitor(AlgorithmNameVisitor(), algorithm);
}

std::string GetAlgorithmParameter(const QuadraticFundingAlgorithm& algorithm)
{
    return boost::apply_visitor(AlgorithmParameterVisitor(), algorithm);
}

bool ParseAlgorithm(const std::string& name,
                    const std::string& parameter,
                    QuadraticFundingAlgorithm& algorithm,
                    CQfValidationState& state)
{
    if (name == ALGORITHM_CLR_NAME) {
        algorithm = CapitalConstrainedLiberalRadicalism(parameter);
        return true;
    }

    LogPrintf("ERROR: %s: unsupported algorithm '%s'\n", __func__, name);
    return state.Error(QfError::UNSUPPORTED_ALGORITHM, "qf-unsupported-algorithm",
                       "algorithm=" + name);
}

// ============================================================================
// Input validation
// ============================================================================

bool CheckRawGrant(const RawGrant& grant, CQfValidationState& state)
{
    CWideAmount sum = 0;
    for (const CAmount& fund : grant.funds) {
        sum += CWideAmount(fund);
    }

    if (!AmountRange(sum)) {
        LogPrintf("ERROR: %s: contribution sum overflow (addr=%s, votes=%u)\n",
                  __func__, grant.addr, grant.funds.size());
        return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-collected-overflow",
                           "addr=" + grant.addr);
    }

    if (sum != CWideAmount(grant.collected_vote_funds)) {
        LogPrintf("ERROR: %s: collected mismatch (addr=%s, collected=%s, sum=%s)\n",
                  __func__, grant.addr, grant.collected_vote_funds, sum);
        return state.Error(QfError::INVALID_INPUT, "qf-collected-mismatch",
                           "addr=" + grant.addr + " collected=" + FormatAmount(grant.collected_vote_funds) +
                           " sum=" + sum.str());
    }

    return true;
}

// ============================================================================
// Liberal Radicalism score
// ============================================================================

bool CalculateLiberalRadicalismScore(const std::vector<CAmount>& funds,
                                     CAmount& score,
                                     CQfValidationState& state)
{
    // Each root is < 2^64; the sum cannot leave 256 bits for any
    // vector that fits in memory, nor can its square.
    CWideAmount sumRoots = 0;
    for (const CAmount& fund : funds) {
        sumRoots += CWideAmount(qf_math::IntegerSqrt(fund));
    }

    const CWideAmount score256 = sumRoots * sumRoots;

    if (!AmountRange(score256)) {
        LogPrintf("ERROR: %s: score overflow (sum of roots=%s, votes=%u)\n",
                  __func__, sumRoots, funds.size());
        return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-score-overflow",
                           "sum_roots=" + sumRoots.str());
    }

    score = static_cast<CAmount>(score256);
    return true;
}

// ============================================================================
// Capital constraint
// ============================================================================

bool ScaleToBudget(const std::vector<CAmount>& scores,
                   const Optional<CAmount>& budget,
                   std::vector<CAmount>& matched,
                   CQfValidationState& state)
{
    if (!budget) {
        // Unconstrained: raw scores are paid verbatim
        matched = scores;
        return true;
    }

    CWideAmount totalScore = 0;
    for (const CAmount& score : scores) {
        totalScore += CWideAmount(score);
    }

    if (!AmountRange(totalScore)) {
        LogPrintf("ERROR: %s: total score overflow (total=%s, grants=%u)\n",
                  __func__, totalScore, scores.size());
        return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-total-score-overflow",
                           "total=" + totalScore.str());
    }

    std::vector<CAmount> vMatched;
    vMatched.reserve(scores.size());

    if (totalScore == 0) {
        // No votes anywhere: everything goes to leftover
        LogPrint(BCLog::QF, "ScaleToBudget: total score is zero, budget=%s becomes leftover\n", *budget);
        vMatched.assign(scores.size(), CAmount(0));
    } else {
        const CWideAmount wideBudget(*budget);
        for (const CAmount& score : scores) {
            // score <= totalScore, so the quotient is <= budget and narrows exactly
            const CWideAmount share = wideBudget * CWideAmount(score) / totalScore;
            vMatched.push_back(static_cast<CAmount>(share));
        }
    }

    matched.swap(vMatched);
    return true;
}

// ============================================================================
// Leftover
// ============================================================================

bool CalculateLeftover(const CAmount& budget,
                       const std::vector<CAmount>& matched,
                       CAmount& leftover,
                       CQfValidationState& state)
{
    CWideAmount distributed = 0;
    for (const CAmount& amount : matched) {
        distributed += CWideAmount(amount);
    }

    if (distributed > CWideAmount(budget)) {
        LogPrintf("ERROR: %s: matched total %s exceeds budget %s\n",
                  __func__, distributed, budget);
        return state.Error(QfError::ARITHMETIC_OVERFLOW, "qf-leftover-underflow",
                           "distributed=" + distributed.str() + " budget=" + FormatAmount(budget));
    }

    leftover = budget - static_cast<CAmount>(distributed);
    return true;
}

// ============================================================================
// Assembly
// ============================================================================

bool AssembleGrantMatches(const std::vector<RawGrant>& grants,
                          const std::vector<CAmount>& matched,
                          std::vector<GrantMatch>& matches,
                          CQfValidationState& state)
{
    if (grants.size() != matched.size()) {
        LogPrintf("ERROR: %s: %u grants but %u matched amounts\n",
                  __func__, grants.size(), matched.size());
        return state.Error(QfError::INVALID_INPUT, "qf-match-count-mismatch");
    }

    std::vector<GrantMatch> vMatches;
    vMatches.reserve(grants.size());
    for (size_t i = 0; i < grants.size(); i++) {
        vMatches.emplace_back(grants[i].addr, matched[i], grants[i].collected_vote_funds);
    }

    matches.swap(vMatches);
    return true;
}

// ============================================================================
// Engine
// ============================================================================

bool CalculateClr(const std::vector<RawGrant>& grants,
                  const Optional<CAmount>& budget,
                  MatchingResult& result,
                  CQfValidationState& state)
{
    LogPrint(BCLog::QF, "CalculateClr: grants=%u budget=%s\n", grants.size(), BudgetToString(budget));

    // 1. + 2. Validate and score
    std::vector<CAmount> vScores;
    vScores.reserve(grants.size());

    for (const RawGrant& grant : grants) {
        if (!CheckRawGrant(grant, state)) {
            return false;
        }

        CAmount score = 0;
        if (!CalculateLiberalRadicalismScore(grant.funds, score, state)) {
            return error("%s: scoring failed for %s: %s", __func__, grant.addr, state.ToString());
        }

        LogPrint(BCLog::QF, "CalculateClr: addr=%s votes=%u collected=%s score=%s\n",
                 grant.addr, grant.funds.size(), grant.collected_vote_funds, score);

        vScores.push_back(score);
    }

    // 3. Scale
    std::vector<CAmount> vMatched;
    if (!ScaleToBudget(vScores, budget, vMatched, state)) {
        return false;
    }

    // 4. Leftover
    MatchingResult res;
    if (budget) {
        CAmount leftover = 0;
        if (!CalculateLeftover(*budget, vMatched, leftover, state)) {
            return false;
        }
        res.leftover = leftover;
    }

    // 5. Assemble
    if (!AssembleGrantMatches(grants, vMatched, res.grants, state)) {
        return false;
    }

    for (const GrantMatch& match : res.grants) {
        LogPrint(BCLog::QF, "CalculateClr: addr=%s grant=%s collected=%s\n",
                 match.addr, match.grant, match.collected_vote_funds);
    }
    LogPrint(BCLog::QF, "CalculateClr: leftover=%s\n",
             res.leftover ? FormatAmount(*res.leftover) : std::string("none"));

    result = std::move(res);
    return true;
}

bool CalculateMatching(const QuadraticFundingAlgorithm& algorithm,
                       const std::vector<RawGrant>& grants,
                       const Optional<CAmount>& budget,
                       MatchingResult& result,
                       CQfValidationState& state)
{
    LogPrint(BCLog::QF, "CalculateMatching: algorithm=%s\n", GetAlgorithmName(algorithm));
    return boost::apply_visitor(MatchingVisitor(grants, budget, result, state), algorithm);
}

} // namespace qf_matching
