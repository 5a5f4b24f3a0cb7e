// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/qf.h"

#include "logging.h"
#include "rpc/server.h"

#include <limits>
#include <stdexcept>

#include <univalue.h>

// ============================================================================
// Field helpers
// ============================================================================

static const UniValue& GetRequiredField(const UniValue& obj, const std::string& key)
{
    if (!obj.isObject()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Expected object containing \"" + key + "\"");
    }
    const UniValue& value = obj[key];
    if (value.isNull()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Missing field \"" + key + "\"");
    }
    return value;
}

static std::string GetStringField(const UniValue& obj, const std::string& key)
{
    const UniValue& value = GetRequiredField(obj, key);
    if (!value.isStr()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Field \"" + key + "\" must be a string");
    }
    return value.get_str();
}

static uint64_t UInt64FromValue(const UniValue& value, const std::string& name)
{
    if (!value.isNum() && !value.isStr()) {
        throw JSONRPCError(RPC_TYPE_ERROR, name + " is not a number or string");
    }
    CAmount n;
    if (!ParseAmount(value.getValStr(), n) || n > std::numeric_limits<uint64_t>::max()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid " + name + ": " + value.getValStr());
    }
    return static_cast<uint64_t>(n);
}

static Optional<std::vector<std::string>> WhitelistFromJSON(const UniValue& value, const std::string& name)
{
    if (value.isNull()) {
        return nullopt;
    }
    if (!value.isArray()) {
        throw JSONRPCError(RPC_TYPE_ERROR, name + " must be an array of addresses");
    }
    std::vector<std::string> vAddrs;
    for (size_t i = 0; i < value.size(); i++) {
        if (!value[i].isStr()) {
            throw JSONRPCError(RPC_TYPE_ERROR, name + " must be an array of addresses");
        }
        vAddrs.push_back(value[i].get_str());
    }
    return vAddrs;
}

static UniValue WhitelistToJSON(const Optional<std::vector<std::string>>& whitelist)
{
    if (!whitelist) {
        return NullUniValue;
    }
    UniValue arr(UniValue::VARR);
    for (const std::string& addr : *whitelist) {
        arr.push_back(addr);
    }
    return arr;
}

static std::vector<Coin> FundsFromJSON(const UniValue& value)
{
    std::vector<Coin> vFunds;
    if (value.isNull()) {
        return vFunds;
    }
    if (!value.isArray()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "funds must be an array of coins");
    }
    for (size_t i = 0; i < value.size(); i++) {
        vFunds.push_back(CoinFromJSON(value[i]));
    }
    return vFunds;
}

static MessageInfo MessageInfoFromJSON(const UniValue& obj)
{
    return MessageInfo(GetStringField(obj, "sender"), FundsFromJSON(obj["funds"]));
}

static int RPCCodeFromState(const CQfValidationState& state)
{
    switch (state.GetError()) {
    case QfError::ARITHMETIC_OVERFLOW:
        return RPC_QF_ARITHMETIC_OVERFLOW;
    case QfError::UNSUPPORTED_ALGORITHM:
        return RPC_QF_UNSUPPORTED_ALGORITHM;
    case QfError::INVALID_INPUT:
    case QfError::INVALID_CONFIG:
        return RPC_QF_INVALID_INPUT;
    case QfError::UNAUTHORIZED:
        return RPC_QF_UNAUTHORIZED;
    case QfError::PROPOSAL_PERIOD_EXPIRED:
    case QfError::VOTING_PERIOD_EXPIRED:
    case QfError::VOTING_PERIOD_NOT_EXPIRED:
    case QfError::PROPOSAL_NOT_FOUND:
    case QfError::ALREADY_VOTED:
    case QfError::WRONG_FUND_COIN:
    case QfError::ALREADY_DISTRIBUTED:
        return RPC_QF_REJECTED;
    case QfError::NONE:
        break;
    }
    return RPC_INTERNAL_ERROR;
}

// ============================================================================
// Encoders / decoders
// ============================================================================

UniValue ValueFromAmount(const CAmount& amount)
{
    return UniValue(FormatAmount(amount));
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    }
    CAmount amount;
    if (!ParseAmount(value.getValStr(), amount)) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount: " + value.getValStr());
    }
    return amount;
}

UniValue JSONRPCErrorFromState(const CQfValidationState& state)
{
    return JSONRPCError(RPCCodeFromState(state), state.ToString());
}

UniValue RawGrantToJSON(const qf_matching::RawGrant& grant)
{
    UniValue funds(UniValue::VARR);
    for (const CAmount& fund : grant.funds) {
        funds.push_back(ValueFromAmount(fund));
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("addr", grant.addr);
    obj.pushKV("funds", funds);
    obj.pushKV("collected_vote_funds", ValueFromAmount(grant.collected_vote_funds));
    return obj;
}

qf_matching::RawGrant RawGrantFromJSON(const UniValue& obj)
{
    qf_matching::RawGrant grant;
    grant.addr = GetStringField(obj, "addr");

    const UniValue& funds = GetRequiredField(obj, "funds");
    if (!funds.isArray()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "funds of " + grant.addr + " must be an array");
    }
    for (size_t i = 0; i < funds.size(); i++) {
        grant.funds.push_back(AmountFromValue(funds[i]));
    }

    grant.collected_vote_funds = AmountFromValue(GetRequiredField(obj, "collected_vote_funds"));
    return grant;
}

UniValue GrantMatchToJSON(const qf_matching::GrantMatch& match)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("addr", match.addr);
    obj.pushKV("grant", ValueFromAmount(match.grant));
    obj.pushKV("collected_vote_funds", ValueFromAmount(match.collected_vote_funds));
    return obj;
}

UniValue MatchingResultToJSON(const qf_matching::MatchingResult& result)
{
    UniValue grants(UniValue::VARR);
    for (const qf_matching::GrantMatch& match : result.grants) {
        grants.push_back(GrantMatchToJSON(match));
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("grants", grants);
    if (result.leftover) {
        obj.pushKV("leftover", ValueFromAmount(*result.leftover));
    }
    return obj;
}

UniValue ExpirationToJSON(const Expiration& expiration)
{
    UniValue obj(UniValue::VOBJ);
    switch (expiration.GetType()) {
    case Expiration::Type::AT_HEIGHT:
        obj.pushKV("at_height", expiration.GetValue());
        break;
    case Expiration::Type::AT_TIME:
        obj.pushKV("at_time", expiration.GetValue());
        break;
    case Expiration::Type::NEVER:
        obj.pushKV("never", UniValue(UniValue::VOBJ));
        break;
    }
    return obj;
}

Expiration ExpirationFromJSON(const UniValue& value)
{
    if (value.isNull()) {
        return Expiration::Never();
    }
    if (!value.isObject() || value.size() != 1) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Expiration must be {\"at_height\": n}, {\"at_time\": t} or {\"never\": {}}");
    }

    const std::string& key = value.getKeys()[0];
    if (key == "at_height") {
        return Expiration::AtHeight(UInt64FromValue(value[key], "at_height"));
    }
    if (key == "at_time") {
        return Expiration::AtTime(UInt64FromValue(value[key], "at_time"));
    }
    if (key == "never") {
        return Expiration::Never();
    }
    throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown expiration \"" + key + "\"");
}

UniValue AlgorithmToJSON(const qf_matching::QuadraticFundingAlgorithm& algorithm)
{
    UniValue params(UniValue::VOBJ);
    params.pushKV("parameter", qf_matching::GetAlgorithmParameter(algorithm));

    UniValue obj(UniValue::VOBJ);
    obj.pushKV(qf_matching::GetAlgorithmName(algorithm), params);
    return obj;
}

qf_matching::QuadraticFundingAlgorithm AlgorithmFromJSON(const UniValue& value)
{
    if (!value.isObject() || value.size() != 1) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Algorithm must be an object with a single algorithm name");
    }

    const std::string& name = value.getKeys()[0];
    const UniValue& params = value[name];

    if (!params.isNull() && !params.isObject()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Parameters of " + name + " must be an object");
    }

    std::string parameter;
    if (params.isObject() && !params["parameter"].isNull()) {
        parameter = GetStringField(params, "parameter");
    }

    qf_matching::QuadraticFundingAlgorithm algorithm;
    CQfValidationState state;
    if (!qf_matching::ParseAlgorithm(name, parameter, algorithm, state)) {
        throw JSONRPCErrorFromState(state);
    }
    return algorithm;
}

UniValue CoinToJSON(const Coin& coin)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("denom", coin.denom);
    obj.pushKV("amount", ValueFromAmount(coin.amount));
    return obj;
}

Coin CoinFromJSON(const UniValue& obj)
{
    return Coin(GetStringField(obj, "denom"), AmountFromValue(GetRequiredField(obj, "amount")));
}

BlockInfo BlockInfoFromJSON(const UniValue& obj)
{
    BlockInfo block;
    if (obj.isNull()) {
        return block;
    }
    if (!obj.isObject()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "block must be {\"height\": n, \"time\": t}");
    }
    if (!obj["height"].isNull()) {
        block.nHeight = UInt64FromValue(obj["height"], "height");
    }
    if (!obj["time"].isNull()) {
        block.nTime = UInt64FromValue(obj["time"], "time");
    }
    return block;
}

UniValue RoundConfigToJSON(const QfRoundConfig& config)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("admin", config.admin);
    obj.pushKV("leftover_addr", config.leftover_addr);
    obj.pushKV("create_proposal_whitelist", WhitelistToJSON(config.create_proposal_whitelist));
    obj.pushKV("vote_proposal_whitelist", WhitelistToJSON(config.vote_proposal_whitelist));
    obj.pushKV("voting_period", ExpirationToJSON(config.voting_period));
    obj.pushKV("proposal_period", ExpirationToJSON(config.proposal_period));
    obj.pushKV("budget", CoinToJSON(config.budget));
    obj.pushKV("algorithm", AlgorithmToJSON(config.algorithm));
    return obj;
}

QfInstantiateMsg InstantiateMsgFromJSON(const UniValue& obj)
{
    QfInstantiateMsg msg;
    msg.admin = GetStringField(obj, "admin");
    msg.leftover_addr = GetStringField(obj, "leftover_addr");
    msg.create_proposal_whitelist = WhitelistFromJSON(obj["create_proposal_whitelist"], "create_proposal_whitelist");
    msg.vote_proposal_whitelist = WhitelistFromJSON(obj["vote_proposal_whitelist"], "vote_proposal_whitelist");
    msg.voting_period = ExpirationFromJSON(obj["voting_period"]);
    msg.proposal_period = ExpirationFromJSON(obj["proposal_period"]);
    msg.budget_denom = GetStringField(obj, "budget_denom");
    if (!obj["algorithm"].isNull()) {
        msg.algorithm = AlgorithmFromJSON(obj["algorithm"]);
    }
    return msg;
}

UniValue ProposalToJSON(const QfProposal& proposal)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", proposal.nId);
    obj.pushKV("title", proposal.title);
    obj.pushKV("description", proposal.description);
    if (proposal.metadata) {
        obj.pushKV("metadata", *proposal.metadata);
    }
    obj.pushKV("fund_address", proposal.fund_address);
    obj.pushKV("collected_funds", ValueFromAmount(proposal.collected_funds));
    return obj;
}

UniValue BankSendToJSON(const BankSend& send)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("to_address", send.to_address);
    obj.pushKV("amount", CoinToJSON(send.amount));
    return obj;
}

// ============================================================================
// Commands
// ============================================================================

/**
 * qfdistribute - Run the matching engine on explicit grants
 *
 * Usage:
 *   qfdistribute {"algorithm": {...}, "budget": "n", "grants": [...]}
 *
 * Without "budget" the raw scores are returned as grants and no leftover
 * is reported.
 */
static UniValue qfdistribute(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "qfdistribute {\"algorithm\":..., \"budget\":\"n\", \"grants\":[...]}\n"
            "\nComputes the quadratic funding matching of a set of grants.\n"
            "\nArguments:\n"
            "1. input    (object, required)\n"
            "{\n"
            "  \"algorithm\": {...},   (object, optional) Matching formula, default\n"
            "                        {\"capital_constrained_liberal_radicalism\": {\"parameter\": \"\"}}\n"
            "  \"budget\": \"n\",        (string, optional) Matching budget, unconstrained if omitted\n"
            "  \"grants\": [           (array, required) Grants in payout order\n"
            "    {\n"
            "      \"addr\": \"addr\",               (string, required) Recipient\n"
            "      \"funds\": [\"n\",...],           (array, required) One contribution per voter\n"
            "      \"collected_vote_funds\": \"n\"   (string, required) Sum of funds\n"
            "    }\n"
            "  ]\n"
            "}\n"
            "\nResult:\n"
            "{\n"
            "  \"grants\": [\n"
            "    {\n"
            "      \"addr\": \"addr\",               (string) Recipient\n"
            "      \"grant\": \"n\",                 (string) Matched amount\n"
            "      \"collected_vote_funds\": \"n\"   (string) Contributions, paid back on top\n"
            "    }\n"
            "  ],\n"
            "  \"leftover\": \"n\"        (string) Budget not distributed (only with a budget)\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("qfdistribute", "'{\"budget\":\"1000\",\"grants\":[{\"addr\":\"a\",\"funds\":[\"100\"],\"collected_vote_funds\":\"100\"}]}'")
        );
    }

    const UniValue& input = request.params[0];
    if (!input.isObject()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Expected input object");
    }

    qf_matching::QuadraticFundingAlgorithm algorithm;
    if (!input["algorithm"].isNull()) {
        algorithm = AlgorithmFromJSON(input["algorithm"]);
    }

    Optional<CAmount> budget;
    if (!input["budget"].isNull()) {
        budget = AmountFromValue(input["budget"]);
    }

    const UniValue& grantsVal = GetRequiredField(input, "grants");
    if (!grantsVal.isArray()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "grants must be an array");
    }

    std::vector<qf_matching::RawGrant> vGrants;
    vGrants.reserve(grantsVal.size());
    for (size_t i = 0; i < grantsVal.size(); i++) {
        vGrants.push_back(RawGrantFromJSON(grantsVal[i]));
    }

    qf_matching::MatchingResult result;
    CQfValidationState state;
    if (!qf_matching::CalculateMatching(algorithm, vGrants, budget, result, state)) {
        LogPrint(BCLog::RPC, "qfdistribute: rejected: %s\n", state.ToString());
        throw JSONRPCErrorFromState(state);
    }

    return MatchingResultToJSON(result);
}

static UniValue RoundActionError(size_t nIndex, const std::string& strAction, const CQfValidationState& state)
{
    return JSONRPCError(RPCCodeFromState(state),
                        "actions[" + std::to_string(nIndex) + "] " + strAction + ": " + state.ToString());
}

/**
 * qfrunround - Replay a complete round
 *
 * Instantiates a fresh round, applies every action in order and returns
 * the resulting proposals and the transfers emitted by the distribution.
 * The first failing action aborts the replay.
 */
static UniValue qfrunround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "qfrunround {\"instantiate\":{...}, \"actions\":[...]}\n"
            "\nReplays a quadratic funding round and returns its final state.\n"
            "\nArguments:\n"
            "1. input    (object, required)\n"
            "{\n"
            "  \"instantiate\": {\n"
            "    \"sender\": \"addr\",      (string, required) Instantiating address\n"
            "    \"block\": {\"height\": n, \"time\": t},  (object, optional) Current block\n"
            "    \"funds\": [{\"denom\": \"d\", \"amount\": \"n\"}],  (array, required) The budget\n"
            "    \"msg\": {\n"
            "      \"admin\": \"addr\",                     (string, required)\n"
            "      \"leftover_addr\": \"addr\",             (string, required)\n"
            "      \"create_proposal_whitelist\": [...],  (array, optional)\n"
            "      \"vote_proposal_whitelist\": [...],    (array, optional)\n"
            "      \"voting_period\": {\"at_height\": n},   (object, optional) Default never\n"
            "      \"proposal_period\": {\"at_height\": n}, (object, optional) Default never\n"
            "      \"budget_denom\": \"d\",                 (string, required)\n"
            "      \"algorithm\": {...}                   (object, optional)\n"
            "    }\n"
            "  },\n"
            "  \"actions\": [           (array, required) Each with \"action\", \"sender\", \"block\"\n"
            "    {\"action\": \"create_proposal\", \"title\": \"t\", \"description\": \"d\",\n"
            "     \"metadata\": \"m\", \"fund_address\": \"addr\"},\n"
            "    {\"action\": \"vote_proposal\", \"proposal_id\": n, \"funds\": [...]},\n"
            "    {\"action\": \"trigger_distribution\"}\n"
            "  ]\n"
            "}\n"
            "\nResult:\n"
            "{\n"
            "  \"config\": {...},        (object) Round configuration\n"
            "  \"proposals\": [...],     (array) Proposals with their votes\n"
            "  \"distributed\": true|false, (boolean) Distribution done\n"
            "  \"transfers\": [          (array) Transfers emitted by the distribution\n"
            "    {\"to_address\": \"addr\", \"amount\": {\"denom\": \"d\", \"amount\": \"n\"}}\n"
            "  ]\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("qfrunround", "'{\"instantiate\":{...},\"actions\":[...]}'")
        );
    }

    const UniValue& input = request.params[0];
    if (!input.isObject()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "Expected input object");
    }

    const UniValue& inst = GetRequiredField(input, "instantiate");
    const UniValue& actions = GetRequiredField(input, "actions");
    if (!actions.isArray()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "actions must be an array");
    }

    CQfRound round;
    CQfValidationState state;

    if (!round.Instantiate(BlockInfoFromJSON(inst["block"]), MessageInfoFromJSON(inst),
                           InstantiateMsgFromJSON(GetRequiredField(inst, "msg")), state)) {
        throw JSONRPCError(RPCCodeFromState(state), "instantiate: " + state.ToString());
    }

    std::vector<BankSend> vTransfers;

    for (size_t i = 0; i < actions.size(); i++) {
        const UniValue& action = actions[i];
        const std::string strAction = GetStringField(action, "action");
        const BlockInfo block = BlockInfoFromJSON(action["block"]);
        const MessageInfo info = MessageInfoFromJSON(action);

        if (strAction == "create_proposal") {
            Optional<std::string> metadata;
            if (!action["metadata"].isNull()) {
                metadata = GetStringField(action, "metadata");
            }
            uint64_t nId = 0;
            if (!round.CreateProposal(block, info, GetStringField(action, "title"),
                                      GetStringField(action, "description"), metadata,
                                      GetStringField(action, "fund_address"), nId, state)) {
                throw RoundActionError(i, strAction, state);
            }
        } else if (strAction == "vote_proposal") {
            const uint64_t nProposalId = UInt64FromValue(GetRequiredField(action, "proposal_id"), "proposal_id");
            if (!round.VoteProposal(block, info, nProposalId, state)) {
                throw RoundActionError(i, strAction, state);
            }
        } else if (strAction == "trigger_distribution") {
            if (!round.TriggerDistribution(block, info, vTransfers, state)) {
                throw RoundActionError(i, strAction, state);
            }
        } else {
            throw JSONRPCError(RPC_INVALID_PARAMETER,
                               "actions[" + std::to_string(i) + "]: unknown action \"" + strAction + "\"");
        }
    }

    QfRoundConfig config;
    if (!round.GetConfig(config)) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Round lost its configuration");
    }

    UniValue proposals(UniValue::VARR);
    for (const QfProposal& proposal : round.GetAllProposals()) {
        UniValue votes(UniValue::VARR);
        for (const QfVote& vote : round.GetVotes(proposal.nId)) {
            UniValue voteObj(UniValue::VOBJ);
            voteObj.pushKV("voter", vote.voter);
            voteObj.pushKV("fund", CoinToJSON(vote.fund));
            votes.push_back(voteObj);
        }
        UniValue proposalObj = ProposalToJSON(proposal);
        proposalObj.pushKV("votes", votes);
        proposals.push_back(proposalObj);
    }

    UniValue transfers(UniValue::VARR);
    for (const BankSend& send : vTransfers) {
        transfers.push_back(BankSendToJSON(send));
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("config", RoundConfigToJSON(config));
    result.pushKV("proposals", proposals);
    result.pushKV("distributed", round.IsDistributed());
    result.pushKV("transfers", transfers);
    return result;
}

// ============================================================================
// RPC Command Registration
// ============================================================================

static const CRPCCommand commands[] = {
    //  category    name                actor (function)      okSafe  argNames
    //  ----------- ------------------  --------------------  ------  ----------
    { "qf",         "qfdistribute",     &qfdistribute,        true,   {"input"} },
    { "qf",         "qfrunround",       &qfrunround,          true,   {"input"} },
};

void RegisterQfRPCCommands(CRPCTable& t)
{
    for (const CRPCCommand& command : commands)
        t.appendCommand(command.name, &command);
}
