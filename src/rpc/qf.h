// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_RPC_QF_H
#define QFUND_RPC_QF_H

#include "amount.h"
#include "qf/qf_expiration.h"
#include "qf/qf_matching.h"
#include "qf/qf_round.h"
#include "qf/qf_validation_state.h"

#include <univalue.h>

class CRPCTable;

/**
 * JSON boundary of the matching engine and the round orchestrator.
 *
 * Amounts travel as decimal strings: a 128-bit amount does not fit a JSON
 * number. Decoders throw JSONRPCError (a UniValue object) on malformed
 * input; encoders never fail.
 */

/** Decimal string of an amount */
UniValue ValueFromAmount(const CAmount& amount);

/**
 * AmountFromValue - Parse an amount
 *
 * Accepts a decimal string or a non-negative integer JSON number.
 * Rejects signs, fractions, exponents and values above MAX_AMOUNT.
 */
CAmount AmountFromValue(const UniValue& value);

/** Map a failed validation state onto a JSON-RPC error object */
UniValue JSONRPCErrorFromState(const CQfValidationState& state);

UniValue RawGrantToJSON(const qf_matching::RawGrant& grant);
qf_matching::RawGrant RawGrantFromJSON(const UniValue& obj);

UniValue GrantMatchToJSON(const qf_matching::GrantMatch& match);
UniValue MatchingResultToJSON(const qf_matching::MatchingResult& result);

/** {"at_height": n} | {"at_time": t} | {"never": {}} */
UniValue ExpirationToJSON(const Expiration& expiration);
Expiration ExpirationFromJSON(const UniValue& value);

/** {"capital_constrained_liberal_radicalism": {"parameter": "..."}} */
UniValue AlgorithmToJSON(const qf_matching::QuadraticFundingAlgorithm& algorithm);
qf_matching::QuadraticFundingAlgorithm AlgorithmFromJSON(const UniValue& value);

UniValue CoinToJSON(const Coin& coin);
Coin CoinFromJSON(const UniValue& obj);

BlockInfo BlockInfoFromJSON(const UniValue& obj);

UniValue RoundConfigToJSON(const QfRoundConfig& config);
QfInstantiateMsg InstantiateMsgFromJSON(const UniValue& obj);

UniValue ProposalToJSON(const QfProposal& proposal);
UniValue BankSendToJSON(const BankSend& send);

void RegisterQfRPCCommands(CRPCTable& t);

#endif // QFUND_RPC_QF_H
