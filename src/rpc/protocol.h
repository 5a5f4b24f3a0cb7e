// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_RPC_PROTOCOL_H
#define QFUND_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes returned in the "code" field of a JSON-RPC error object
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR       = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR       = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER = -8, //!< Invalid, missing or duplicate parameter

    //! Round / engine errors
    RPC_QF_ARITHMETIC_OVERFLOW   = -40, //!< Sum, square or product out of range
    RPC_QF_UNSUPPORTED_ALGORITHM = -41, //!< Unknown matching algorithm
    RPC_QF_INVALID_INPUT         = -42, //!< Inconsistent grant or configuration
    RPC_QF_UNAUTHORIZED          = -43, //!< Sender not admin or not whitelisted
    RPC_QF_REJECTED              = -44, //!< Round operation rejected (period, vote, funds)
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // QFUND_RPC_PROTOCOL_H
