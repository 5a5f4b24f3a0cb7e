// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the Capital-Constrained Liberal Radicalism matching engine
//
// Reference round (budget 550000):
//   grant   funds                   score    matched
//   addr1   [1200, 44999, 33]        63001     60212
//   addr2   [30000, 58999]          172225    164602
//   addr3   [230000, 100]           239121    228537
//   addr4   [100000, 5]             101124     96648
//   total score 575471, leftover 1
//
// Tests verify:
// - Liberal Radicalism scoring and its quadratic shape
// - Proportional scaling with floor truncation
// - Conservation: sum(grant) + leftover == budget
// - Unconstrained mode, zero votes, empty rounds
// - Overflow and inconsistent input rejection (result untouched)
//

#include "test/test_qfund.h"

#include "qf/qf_matching.h"

#include <boost/test/unit_test.hpp>

using namespace qf_matching;

BOOST_FIXTURE_TEST_SUITE(qf_matching_tests, BasicTestingSetup)

// ============================================================================
// HELPERS
// ============================================================================

static RawGrant MakeGrant(const std::string& addr, const std::vector<CAmount>& funds)
{
    CAmount collected = 0;
    for (const CAmount& fund : funds) {
        collected += fund;
    }
    return RawGrant(addr, funds, collected);
}

static std::vector<RawGrant> ReferenceGrants()
{
    return {
        MakeGrant("addr1", {1200, 44999, 33}),
        MakeGrant("addr2", {30000, 58999}),
        MakeGrant("addr3", {230000, 100}),
        MakeGrant("addr4", {100000, 5}),
    };
}

static CAmount SumGrants(const MatchingResult& result)
{
    CAmount sum = 0;
    for (const GrantMatch& match : result.grants) {
        sum += match.grant;
    }
    return sum;
}

static MatchingResult Sentinel()
{
    MatchingResult sentinel;
    sentinel.grants.emplace_back("sentinel", 7, 7);
    sentinel.leftover = CAmount(7);
    return sentinel;
}

static bool IsSentinel(const MatchingResult& result)
{
    return result.grants.size() == 1 && result.grants[0] == GrantMatch("sentinel", 7, 7) &&
           result.leftover && *result.leftover == 7;
}

// ============================================================================
// TEST 1: Liberal Radicalism score
// ============================================================================

BOOST_AUTO_TEST_CASE(lr_score_reference)
{
    const std::vector<RawGrant> grants = ReferenceGrants();
    const unsigned int expected[] = {63001, 172225, 239121, 101124};

    for (size_t i = 0; i < grants.size(); i++) {
        CQfValidationState state;
        CAmount score = 0;
        BOOST_CHECK(CalculateLiberalRadicalismScore(grants[i].funds, score, state));
        BOOST_CHECK(state.IsValid());
        BOOST_CHECK_EQUAL(score, expected[i]);
    }
}

BOOST_AUTO_TEST_CASE(lr_score_quadratic_shape)
{
    CQfValidationState state;
    CAmount scoreMany = 0;
    CAmount scoreOne = 0;

    // Same total (400), different breadth of support
    BOOST_CHECK(CalculateLiberalRadicalismScore({100, 100, 100, 100}, scoreMany, state));
    BOOST_CHECK(CalculateLiberalRadicalismScore({400}, scoreOne, state));

    BOOST_CHECK_EQUAL(scoreMany, 1600);
    BOOST_CHECK_EQUAL(scoreOne, 400);
    BOOST_CHECK(scoreMany > scoreOne);
}

BOOST_AUTO_TEST_CASE(lr_score_empty_and_zero)
{
    CQfValidationState state;
    CAmount score = 99;

    BOOST_CHECK(CalculateLiberalRadicalismScore({}, score, state));
    BOOST_CHECK_EQUAL(score, 0);

    BOOST_CHECK(CalculateLiberalRadicalismScore({0, 0, 0}, score, state));
    BOOST_CHECK_EQUAL(score, 0);

    // isqrt floors each contribution before summing
    BOOST_CHECK(CalculateLiberalRadicalismScore({3, 3}, score, state));
    BOOST_CHECK_EQUAL(score, 4);
}

BOOST_AUTO_TEST_CASE(lr_score_overflow)
{
    CQfValidationState state;
    CAmount score = 42;

    // (2 * (2^64 - 1))^2 > 2^128 - 1
    BOOST_CHECK(!CalculateLiberalRadicalismScore({MAX_AMOUNT, MAX_AMOUNT}, score, state));
    BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-score-overflow");
    BOOST_CHECK_EQUAL(score, 42);

    // A single contribution never overflows: isqrt(n)^2 <= n
    CQfValidationState state2;
    BOOST_CHECK(CalculateLiberalRadicalismScore({MAX_AMOUNT}, score, state2));
    BOOST_CHECK(state2.IsValid());
    BOOST_CHECK(score <= MAX_AMOUNT);
}

// ============================================================================
// TEST 2: Capital constraint
// ============================================================================

BOOST_AUTO_TEST_CASE(scale_proportional_floor)
{
    CQfValidationState state;
    std::vector<CAmount> matched;

    BOOST_CHECK(ScaleToBudget({63001, 172225, 239121, 101124}, CAmount(550000), matched, state));
    BOOST_REQUIRE_EQUAL(matched.size(), 4U);
    BOOST_CHECK_EQUAL(matched[0], 60212);
    BOOST_CHECK_EQUAL(matched[1], 164602);
    BOOST_CHECK_EQUAL(matched[2], 228537);
    BOOST_CHECK_EQUAL(matched[3], 96648);

    // 1 / 3 each, 2 lost to truncation
    BOOST_CHECK(ScaleToBudget({1, 1, 1}, CAmount(11), matched, state));
    BOOST_REQUIRE_EQUAL(matched.size(), 3U);
    BOOST_CHECK_EQUAL(matched[0], 3);
    BOOST_CHECK_EQUAL(matched[1], 3);
    BOOST_CHECK_EQUAL(matched[2], 3);
}

BOOST_AUTO_TEST_CASE(scale_unconstrained_and_zero_total)
{
    CQfValidationState state;
    std::vector<CAmount> matched;

    BOOST_CHECK(ScaleToBudget({5, 0, 9}, nullopt, matched, state));
    BOOST_REQUIRE_EQUAL(matched.size(), 3U);
    BOOST_CHECK_EQUAL(matched[0], 5);
    BOOST_CHECK_EQUAL(matched[1], 0);
    BOOST_CHECK_EQUAL(matched[2], 9);

    BOOST_CHECK(ScaleToBudget({0, 0}, CAmount(1000), matched, state));
    BOOST_REQUIRE_EQUAL(matched.size(), 2U);
    BOOST_CHECK_EQUAL(matched[0], 0);
    BOOST_CHECK_EQUAL(matched[1], 0);

    BOOST_CHECK(ScaleToBudget({}, CAmount(1000), matched, state));
    BOOST_CHECK(matched.empty());
}

BOOST_AUTO_TEST_CASE(scale_total_score_overflow)
{
    CQfValidationState state;
    std::vector<CAmount> matched = {1};

    const CAmount big = CAmount(1) << 126;
    BOOST_CHECK(!ScaleToBudget({big, big, big, big}, CAmount(1000), matched, state));
    BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-total-score-overflow");
    BOOST_REQUIRE_EQUAL(matched.size(), 1U);
    BOOST_CHECK_EQUAL(matched[0], 1);

    // No total is formed without a budget
    CQfValidationState state2;
    BOOST_CHECK(ScaleToBudget({big, big, big, big}, nullopt, matched, state2));
    BOOST_CHECK_EQUAL(matched.size(), 4U);
}

// ============================================================================
// TEST 3: Leftover and assembly
// ============================================================================

BOOST_AUTO_TEST_CASE(leftover_accounting)
{
    CQfValidationState state;
    CAmount leftover = 0;

    BOOST_CHECK(CalculateLeftover(550000, {60212, 164602, 228537, 96648}, leftover, state));
    BOOST_CHECK_EQUAL(leftover, 1);

    BOOST_CHECK(CalculateLeftover(1000, {}, leftover, state));
    BOOST_CHECK_EQUAL(leftover, 1000);

    BOOST_CHECK(CalculateLeftover(1000, {400, 600}, leftover, state));
    BOOST_CHECK_EQUAL(leftover, 0);

    // Overspending is refused, never wrapped
    leftover = 77;
    BOOST_CHECK(!CalculateLeftover(10, {6, 5}, leftover, state));
    BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-leftover-underflow");
    BOOST_CHECK_EQUAL(leftover, 77);
}

BOOST_AUTO_TEST_CASE(assemble_preserves_order)
{
    CQfValidationState state;
    std::vector<GrantMatch> matches;

    const std::vector<RawGrant> grants = ReferenceGrants();
    BOOST_CHECK(AssembleGrantMatches(grants, {4, 3, 2, 1}, matches, state));
    BOOST_REQUIRE_EQUAL(matches.size(), 4U);
    BOOST_CHECK(matches[0] == GrantMatch("addr1", 4, 46232));
    BOOST_CHECK(matches[1] == GrantMatch("addr2", 3, 88999));
    BOOST_CHECK(matches[2] == GrantMatch("addr3", 2, 230100));
    BOOST_CHECK(matches[3] == GrantMatch("addr4", 1, 100005));

    BOOST_CHECK(!AssembleGrantMatches(grants, {1, 2}, matches, state));
    BOOST_CHECK(state.GetError() == QfError::INVALID_INPUT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-match-count-mismatch");
    BOOST_CHECK_EQUAL(matches.size(), 4U);
}

// ============================================================================
// TEST 4: Full engine
// ============================================================================

BOOST_AUTO_TEST_CASE(clr_reference_round)
{
    CQfValidationState state;
    MatchingResult result;

    BOOST_CHECK(CalculateMatching(CapitalConstrainedLiberalRadicalism(""), ReferenceGrants(),
                                  CAmount(550000), result, state));
    BOOST_CHECK(state.IsValid());

    BOOST_REQUIRE_EQUAL(result.grants.size(), 4U);
    BOOST_CHECK(result.grants[0] == GrantMatch("addr1", 60212, 46232));
    BOOST_CHECK(result.grants[1] == GrantMatch("addr2", 164602, 88999));
    BOOST_CHECK(result.grants[2] == GrantMatch("addr3", 228537, 230100));
    BOOST_CHECK(result.grants[3] == GrantMatch("addr4", 96648, 100005));

    BOOST_REQUIRE(result.leftover);
    BOOST_CHECK_EQUAL(*result.leftover, 1);
    BOOST_CHECK_EQUAL(SumGrants(result) + *result.leftover, 550000);
}

BOOST_AUTO_TEST_CASE(clr_unconstrained_returns_scores)
{
    CQfValidationState state;
    MatchingResult result;

    BOOST_CHECK(CalculateClr(ReferenceGrants(), nullopt, result, state));
    BOOST_REQUIRE_EQUAL(result.grants.size(), 4U);
    BOOST_CHECK_EQUAL(result.grants[0].grant, 63001);
    BOOST_CHECK_EQUAL(result.grants[1].grant, 172225);
    BOOST_CHECK_EQUAL(result.grants[2].grant, 239121);
    BOOST_CHECK_EQUAL(result.grants[3].grant, 101124);
    BOOST_CHECK(!result.leftover);
}

BOOST_AUTO_TEST_CASE(clr_quadratic_shape_split)
{
    CQfValidationState state;
    MatchingResult result;

    std::vector<RawGrant> grants = {
        MakeGrant("many", {100, 100, 100, 100}),
        MakeGrant("one", {400}),
    };

    BOOST_CHECK(CalculateClr(grants, CAmount(1000), result, state));
    BOOST_REQUIRE_EQUAL(result.grants.size(), 2U);
    BOOST_CHECK_EQUAL(result.grants[0].grant, 800);
    BOOST_CHECK_EQUAL(result.grants[1].grant, 200);
    BOOST_CHECK_EQUAL(*result.leftover, 0);
}

BOOST_AUTO_TEST_CASE(clr_zero_votes)
{
    CQfValidationState state;
    MatchingResult result;

    // Nobody voted: whole budget is leftover
    std::vector<RawGrant> grants = {MakeGrant("a", {}), MakeGrant("b", {})};
    BOOST_CHECK(CalculateClr(grants, CAmount(1000), result, state));
    BOOST_REQUIRE_EQUAL(result.grants.size(), 2U);
    BOOST_CHECK_EQUAL(result.grants[0].grant, 0);
    BOOST_CHECK_EQUAL(result.grants[1].grant, 0);
    BOOST_CHECK_EQUAL(*result.leftover, 1000);

    // A zero-vote grant next to a voted one gets nothing
    grants = {MakeGrant("a", {}), MakeGrant("b", {100})};
    BOOST_CHECK(CalculateClr(grants, CAmount(1000), result, state));
    BOOST_CHECK_EQUAL(result.grants[0].grant, 0);
    BOOST_CHECK_EQUAL(result.grants[1].grant, 1000);
    BOOST_CHECK_EQUAL(*result.leftover, 0);

    // No grants at all
    BOOST_CHECK(CalculateClr({}, CAmount(500), result, state));
    BOOST_CHECK(result.grants.empty());
    BOOST_CHECK_EQUAL(*result.leftover, 500);
}

BOOST_AUTO_TEST_CASE(clr_zero_budget)
{
    CQfValidationState state;
    MatchingResult result;

    BOOST_CHECK(CalculateClr(ReferenceGrants(), CAmount(0), result, state));
    for (const GrantMatch& match : result.grants) {
        BOOST_CHECK_EQUAL(match.grant, 0);
    }
    BOOST_CHECK_EQUAL(*result.leftover, 0);
}

BOOST_AUTO_TEST_CASE(clr_max_budget_no_overflow)
{
    CQfValidationState state;
    MatchingResult result;

    // budget * score needs more than 128 bits
    BOOST_CHECK(CalculateClr(ReferenceGrants(), MAX_AMOUNT, result, state));
    BOOST_REQUIRE_EQUAL(result.grants.size(), 4U);
    BOOST_CHECK_EQUAL(result.grants[0].grant, AmountFromString("37253188081390798383682346534940647034"));
    BOOST_CHECK_EQUAL(result.grants[1].grant, AmountFromString("101838547282067431495209474960399881519"));
    BOOST_CHECK_EQUAL(result.grants[2].grant, AmountFromString("141394891941560437140751835459461634889"));
    BOOST_CHECK_EQUAL(result.grants[3].grant, AmountFromString("59795739615919796443730950476966048011"));
    BOOST_CHECK_EQUAL(*result.leftover, 2);
    BOOST_CHECK_EQUAL(SumGrants(result) + *result.leftover, MAX_AMOUNT);
}

BOOST_AUTO_TEST_CASE(clr_conservation_property)
{
    // Deterministic LCG so failures are reproducible
    uint64_t seed = 0x5eed;
    auto next = [&seed]() {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        return seed >> 33;
    };

    for (int round = 0; round < 200; round++) {
        std::vector<RawGrant> grants;
        const int nGrants = next() % 8;
        for (int g = 0; g < nGrants; g++) {
            std::vector<CAmount> funds;
            const int nVotes = next() % 6;
            for (int v = 0; v < nVotes; v++) {
                funds.push_back(CAmount(next() % 1000000));
            }
            grants.push_back(MakeGrant("g" + std::to_string(g), funds));
        }
        const CAmount budget(next());

        CQfValidationState state;
        MatchingResult result;
        BOOST_REQUIRE(CalculateClr(grants, budget, result, state));
        BOOST_REQUIRE(result.leftover);
        BOOST_REQUIRE_EQUAL(result.grants.size(), grants.size());

        BOOST_CHECK_EQUAL(SumGrants(result) + *result.leftover, budget);
        for (size_t i = 0; i < grants.size(); i++) {
            BOOST_CHECK(result.grants[i].grant <= budget);
            BOOST_CHECK_EQUAL(result.grants[i].addr, grants[i].addr);
            BOOST_CHECK_EQUAL(result.grants[i].collected_vote_funds, grants[i].collected_vote_funds);
        }
    }
}

BOOST_AUTO_TEST_CASE(clr_deterministic)
{
    MatchingResult first;
    MatchingResult second;
    CQfValidationState state;

    BOOST_CHECK(CalculateClr(ReferenceGrants(), CAmount(123457), first, state));
    BOOST_CHECK(CalculateClr(ReferenceGrants(), CAmount(123457), second, state));

    BOOST_REQUIRE_EQUAL(first.grants.size(), second.grants.size());
    for (size_t i = 0; i < first.grants.size(); i++) {
        BOOST_CHECK(first.grants[i] == second.grants[i]);
    }
    BOOST_CHECK(first.leftover == second.leftover);
}

BOOST_AUTO_TEST_CASE(clr_rejects_collected_mismatch)
{
    CQfValidationState state;
    MatchingResult result = Sentinel();

    std::vector<RawGrant> grants = ReferenceGrants();
    grants[2].collected_vote_funds = 230099;

    BOOST_CHECK(!CalculateClr(grants, CAmount(550000), result, state));
    BOOST_CHECK(state.GetError() == QfError::INVALID_INPUT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-collected-mismatch");
    BOOST_CHECK(IsSentinel(result));
}

BOOST_AUTO_TEST_CASE(clr_overflow_is_atomic)
{
    const CAmount big = CAmount(1) << 126;

    // Sum fits (3 * 2^126) but the score (3 * 2^63)^2 does not
    {
        CQfValidationState state;
        MatchingResult result = Sentinel();
        std::vector<RawGrant> grants = {MakeGrant("ok", {100}), MakeGrant("huge", {big, big, big})};
        BOOST_CHECK(!CalculateClr(grants, CAmount(1000), result, state));
        BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-score-overflow");
        BOOST_CHECK(IsSentinel(result));
    }

    // Each score fits, their total does not
    {
        CQfValidationState state;
        MatchingResult result = Sentinel();
        std::vector<RawGrant> grants = {
            MakeGrant("a", {big}), MakeGrant("b", {big}), MakeGrant("c", {big}), MakeGrant("d", {big}),
        };
        BOOST_CHECK(!CalculateClr(grants, CAmount(1000), result, state));
        BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-total-score-overflow");
        BOOST_CHECK(IsSentinel(result));
    }

    // Contributions whose sum leaves the range
    {
        CQfValidationState state;
        MatchingResult result = Sentinel();
        std::vector<RawGrant> grants = {RawGrant("x", {MAX_AMOUNT, MAX_AMOUNT}, MAX_AMOUNT)};
        BOOST_CHECK(!CalculateClr(grants, CAmount(1000), result, state));
        BOOST_CHECK(state.GetError() == QfError::ARITHMETIC_OVERFLOW);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-collected-overflow");
        BOOST_CHECK(IsSentinel(result));
    }
}

// ============================================================================
// TEST 5: Algorithm dispatch
// ============================================================================

BOOST_AUTO_TEST_CASE(algorithm_parse_and_names)
{
    CQfValidationState state;
    QuadraticFundingAlgorithm algorithm;

    BOOST_CHECK(ParseAlgorithm("capital_constrained_liberal_radicalism", "alpha", algorithm, state));
    BOOST_CHECK_EQUAL(GetAlgorithmName(algorithm), "capital_constrained_liberal_radicalism");
    BOOST_CHECK_EQUAL(GetAlgorithmParameter(algorithm), "alpha");

    BOOST_CHECK(!ParseAlgorithm("pairwise_bounded", "", algorithm, state));
    BOOST_CHECK(state.GetError() == QfError::UNSUPPORTED_ALGORITHM);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "qf-unsupported-algorithm");
    // Previous value kept
    BOOST_CHECK_EQUAL(GetAlgorithmParameter(algorithm), "alpha");
}

BOOST_AUTO_TEST_CASE(algorithm_parameter_is_inert)
{
    CQfValidationState state;
    MatchingResult plain;
    MatchingResult tuned;

    BOOST_CHECK(CalculateMatching(CapitalConstrainedLiberalRadicalism(""), ReferenceGrants(),
                                  CAmount(550000), plain, state));
    BOOST_CHECK(CalculateMatching(CapitalConstrainedLiberalRadicalism("0.5"), ReferenceGrants(),
                                  CAmount(550000), tuned, state));

    BOOST_REQUIRE_EQUAL(plain.grants.size(), tuned.grants.size());
    for (size_t i = 0; i < plain.grants.size(); i++) {
        BOOST_CHECK(plain.grants[i] == tuned.grants[i]);
    }
    BOOST_CHECK(plain.leftover == tuned.leftover);
}

BOOST_AUTO_TEST_SUITE_END()
