// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_QF_MATCHING_H
#define QFUND_QF_MATCHING_H

#include "amount.h"
#include "optional.h"
#include "qf/qf_validation_state.h"

#include <boost/variant.hpp>

#include <string>
#include <vector>

/**
 * Quadratic funding matching engine
 *
 * Converts the per-proposal contribution lists of one round into matched
 * amounts drawn from a fixed budget.
 *
 * ARCHITECTURE:
 * - Pure function of its inputs: no I/O (besides debug logging), no clock,
 *   no randomness, no floating point
 * - Integer-only arithmetic, widened to 256 bits before any product
 * - All or nothing: on any error the result is left untouched
 *
 * INVARIANTS (budget present):
 * - sum(grant_i) + leftover == budget
 * - grant_i <= budget
 * - output order == input order
 */

namespace qf_matching {

/**
 * Capital-Constrained Liberal Radicalism (CLR)
 *
 * score_i = (sum_j isqrt(fund_ij))^2, then scaled proportionally into the
 * budget with floor truncation.
 *
 * The parameter is reserved: accepted and carried through configuration
 * but not consumed by the formula.
 */
struct CapitalConstrainedLiberalRadicalism
{
    std::string parameter;

    CapitalConstrainedLiberalRadicalism() {}
    explicit CapitalConstrainedLiberalRadicalism(const std::string& parameterIn) : parameter(parameterIn) {}

    bool operator==(const CapitalConstrainedLiberalRadicalism& other) const { return parameter == other.parameter; }
};

/**
 * Closed set of supported matching formulas.
 *
 * Adding a formula means adding an alternative here plus one overload in
 * each visitor in qf_matching.cpp; existing branches stay untouched.
 */
typedef boost::variant<CapitalConstrainedLiberalRadicalism> QuadraticFundingAlgorithm;

//! Tag of the CLR formula in configuration and JSON
static const char* const ALGORITHM_CLR_NAME = "capital_constrained_liberal_radicalism";

/** Configuration tag of an algorithm (e.g. "capital_constrained_liberal_radicalism") */
std::string GetAlgorithmName(const QuadraticFundingAlgorithm& algorithm);

/** Reserved parameter carried by an algorithm */
std::string GetAlgorithmParameter(const QuadraticFundingAlgorithm& algorithm);

/**
 * ParseAlgorithm - Build an algorithm from its configuration tag
 *
 * @param name       Algorithm tag
 * @param parameter  Reserved parameter (stored, not interpreted)
 * @param algorithm  Output (untouched on failure)
 * @param state      UNSUPPORTED_ALGORITHM if the tag is unknown
 * @return true on success
 */
bool ParseAlgorithm(const std::string& name,
                    const std::string& parameter,
                    QuadraticFundingAlgorithm& algorithm,
                    CQfValidationState& state);

/**
 * RawGrant - One proposal's input to the engine
 *
 * funds holds one contribution per voter. collected_vote_funds must equal
 * the sum of funds: the engine refuses inconsistent input instead of
 * trusting the caller.
 */
struct RawGrant
{
    std::string addr;
    std::vector<CAmount> funds;
    CAmount collected_vote_funds;

    RawGrant() : collected_vote_funds(0) {}
    RawGrant(const std::string& addrIn, const std::vector<CAmount>& fundsIn, const CAmount& collectedIn)
        : addr(addrIn), funds(fundsIn), collected_vote_funds(collectedIn) {}
};

/**
 * GrantMatch - Engine output for one proposal
 *
 * The transfer emitter pays grant + collected_vote_funds to addr.
 */
struct GrantMatch
{
    std::string addr;
    CAmount grant;
    CAmount collected_vote_funds;

    GrantMatch() : grant(0), collected_vote_funds(0) {}
    GrantMatch(const std::string& addrIn, const CAmount& grantIn, const CAmount& collectedIn)
        : addr(addrIn), grant(grantIn), collected_vote_funds(collectedIn) {}

    bool operator==(const GrantMatch& other) const
    {
        return addr == other.addr && grant == other.grant &&
               collected_vote_funds == other.collected_vote_funds;
    }
    bool operator!=(const GrantMatch& other) const { return !(*this == other); }
};

/**
 * MatchingResult - Full engine output
 *
 * leftover is engaged exactly when a budget was given; it is the part of
 * the budget lost to floor truncation and must be paid to the round's
 * fallback address.
 */
struct MatchingResult
{
    std::vector<GrantMatch> grants;
    Optional<CAmount> leftover;

    void SetNull()
    {
        grants.clear();
        leftover = nullopt;
    }
};

/**
 * CheckRawGrant - Verify collected_vote_funds == sum(funds)
 *
 * @param grant  Grant to check
 * @param state  INVALID_INPUT on mismatch, ARITHMETIC_OVERFLOW if the
 *               sum leaves the CAmount range
 * @return true if consistent
 */
bool CheckRawGrant(const RawGrant& grant, CQfValidationState& state);

/**
 * CalculateLiberalRadicalismScore - (sum_j isqrt(fund_j))^2
 *
 * Many small contributions outscore one large contribution of the same
 * total: [100,100,100,100] -> 1600, [400] -> 400.
 * An empty list scores 0.
 *
 * @param funds  Contributions of one proposal
 * @param score  Output (untouched on failure)
 * @param state  ARITHMETIC_OVERFLOW if the square exceeds CAmount
 * @return true on success
 */
bool CalculateLiberalRadicalismScore(const std::vector<CAmount>& funds,
                                     CAmount& score,
                                     CQfValidationState& state);

/**
 * ScaleToBudget - Capital constraint
 *
 * - no budget:               matched_i = score_i
 * - budget b, total > 0:     matched_i = floor(b * score_i / total)
 * - budget b, total == 0:    matched_i = 0 (whole budget becomes leftover)
 *
 * The product b * score_i is formed in CWideAmount before dividing.
 *
 * @param scores   Raw scores, one per grant
 * @param budget   Optional capital limit
 * @param matched  Output, same order as scores (untouched on failure)
 * @param state    ARITHMETIC_OVERFLOW if the total score exceeds CAmount
 * @return true on success
 */
bool ScaleToBudget(const std::vector<CAmount>& scores,
                   const Optional<CAmount>& budget,
                   std::vector<CAmount>& matched,
                   CQfValidationState& state);

/**
 * CalculateLeftover - budget - sum(matched)
 *
 * Enforces conservation rather than assuming it: a matched sum above the
 * budget is reported as ARITHMETIC_OVERFLOW.
 *
 * @param budget    Capital limit
 * @param matched   Matched amounts
 * @param leftover  Output (untouched on failure)
 * @param state     Validation state
 * @return true on success
 */
bool CalculateLeftover(const CAmount& budget,
                       const std::vector<CAmount>& matched,
                       CAmount& leftover,
                       CQfValidationState& state);

/**
 * AssembleGrantMatches - Pair matched amounts back onto their grants
 *
 * @param grants   Engine input, defines the order
 * @param matched  One amount per grant
 * @param matches  Output in input order (untouched on failure)
 * @param state    INVALID_INPUT if the sizes differ
 * @return true on success
 */
bool AssembleGrantMatches(const std::vector<RawGrant>& grants,
                          const std::vector<CAmount>& matched,
                          std::vector<GrantMatch>& matches,
                          CQfValidationState& state);

/**
 * CalculateClr - Capital-Constrained Liberal Radicalism distribution
 *
 * ALGORITHM (consensus-critical):
 * 1. Validate every grant (collected == sum of funds)
 * 2. Score every grant: (sum isqrt(fund))^2
 * 3. Scale scores into the budget (floor truncation)
 * 4. leftover = budget - sum(matched)
 * 5. Assemble (addr, matched, collected) in input order
 *
 * @param grants  Ordered grants (read-only)
 * @param budget  Optional capital limit
 * @param result  Output (untouched on failure)
 * @param state   Validation state
 * @return true on success
 */
bool CalculateClr(const std::vector<RawGrant>& grants,
                  const Optional<CAmount>& budget,
                  MatchingResult& result,
                  CQfValidationState& state);

/**
 * CalculateMatching - Engine entry point
 *
 * Dispatches once on the algorithm and runs the selected formula.
 *
 * @param algorithm  Matching formula
 * @param grants     Ordered grants (read-only)
 * @param budget     Optional capital limit
 * @param result     Output (untouched on failure)
 * @param state      Validation state
 * @return true on success
 */
bool CalculateMatching(const QuadraticFundingAlgorithm& algorithm,
                       const std::vector<RawGrant>& grants,
                       const Optional<CAmount>& budget,
                       MatchingResult& result,
                       CQfValidationState& state);

} // namespace qf_matching

#endif // QFUND_QF_MATCHING_H
