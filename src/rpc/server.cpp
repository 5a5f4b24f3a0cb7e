// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "logging.h"

#include <set>
#include <stdexcept>

CRPCTable tableRPC;

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> qfund-cli " + methodname + " " + args + "\n";
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;

    for (const auto& entry : mapCommands) {
        const CRPCCommand* pcmd = entry.second;
        if (!strCommand.empty() && entry.first != strCommand)
            continue;
        if (setDone.count(pcmd->actor))
            continue;
        setDone.insert(pcmd->actor);

        try {
            JSONRPCRequest jreq;
            jreq.fHelp = true;
            (*pcmd->actor)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand.empty()) {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    strRet += "== " + category + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet.empty())
        strRet = "help: unknown command: " + strCommand + "\n";
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    LogPrint(BCLog::RPC, "RPC method=%s\n", request.strMethod);

    try {
        return pcmd->actor(request);
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands) {
        commandList.push_back(entry.first);
    }
    return commandList;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    if (mapCommands.count(name))
        return false;

    mapCommands[name] = pcmd;
    return true;
}
