// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QFUND_RPC_SERVER_H
#define QFUND_RPC_SERVER_H

#include "rpc/protocol.h"

#include <map>
#include <string>
#include <vector>

#include <univalue.h>

class JSONRPCRequest
{
public:
    std::string strMethod;
    UniValue params;
    bool fHelp;

    JSONRPCRequest() : params(UniValue::VARR), fHelp(false) {}
};

typedef UniValue (*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * Command dispatcher
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable() {}
    const CRPCCommand* operator[](const std::string& name) const;

    /** Help text of one command, or the list of all commands if strCommand is empty */
    std::string help(const std::string& strCommand) const;

    /**
     * Execute a method.
     * @param request  Method name, params and help flag
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /** Returns a list of registered commands */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if a command with the same name is already registered.
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

std::string HelpExampleCli(const std::string& methodname, const std::string& args);

#endif // QFUND_RPC_SERVER_H
