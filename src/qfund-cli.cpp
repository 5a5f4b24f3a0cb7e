// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"
#include "logging.h"
#include "rpc/protocol.h"
#include "rpc/qf.h"
#include "rpc/server.h"

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <univalue.h>

static const char* const CLI_USAGE =
    "Usage: qfund-cli <command> [options]\n"
    "\n"
    "Commands:\n"
    "  distribute   Compute matched grants for explicit grants (qfdistribute)\n"
    "  round        Replay a complete funding round (qfrunround)\n"
    "  help         Show help of the underlying commands\n";

static bool ReadInput(const std::string& strPath, std::string& strOut)
{
    if (strPath == "-") {
        strOut.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream file(strPath);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    strOut = ss.str();
    return !file.bad();
}

/** Copy of obj without key, so it can be pushed again */
static UniValue WithoutKey(const UniValue& obj, const std::string& key)
{
    UniValue out(UniValue::VOBJ);
    const std::vector<std::string>& keys = obj.getKeys();
    const std::vector<UniValue>& values = obj.getValues();
    for (size_t i = 0; i < keys.size(); i++) {
        if (keys[i] != key) {
            out.pushKV(keys[i], values[i]);
        }
    }
    return out;
}

static int CommandLineRPC(const std::string& strMethod, UniValue input)
{
    JSONRPCRequest request;
    request.strMethod = strMethod;
    request.params.push_back(input);

    try {
        const UniValue result = tableRPC.execute(request);
        std::cout << result.write(2) << std::endl;
        return 0;
    } catch (const UniValue& objError) {
        const UniValue& code = objError["code"];
        const UniValue& message = objError["message"];
        if (code.isNum() && message.isStr()) {
            std::cerr << "error code: " << code.getValStr() << "\n"
                      << "error message:\n" << message.get_str() << std::endl;
        } else {
            std::cerr << "error: " << objError.write() << std::endl;
        }
    }
    return 1;
}

int main(int argc, char* argv[])
{
    namespace po = boost::program_options;

    RegisterQfRPCCommands(tableRPC);

    po::options_description options("Allowed options");
    options.add_options()("input,i", po::value<std::string>()->default_value("-"), "JSON input file, - for stdin");
    options.add_options()("budget", po::value<std::string>(), "Matching budget (distribute only), overrides the input");
    options.add_options()("unconstrained", po::bool_switch()->default_value(false), "Distribute raw scores without a budget (distribute only)");
    options.add_options()("debug", po::value<std::vector<std::string>>()->composing(),
                          ("Output debugging information for a category (repeatable): " + ListLogCategories() + ", all").c_str());
    options.add_options()("printtoconsole", po::bool_switch()->default_value(false), "Send trace/debug info to console");
    options.add_options()("debuglogfile", po::value<std::string>(), "Append trace/debug info to this file");
    options.add_options()("help,h", "Print usage instructions");

    po::options_description hidden("Hidden options");
    hidden.add_options()("command", po::value<std::string>(), "Command to run");
    hidden.add_options()("args", po::value<std::vector<std::string>>(), "Command arguments");

    po::options_description all;
    all.add(options).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map options_map;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), options_map);
        po::notify(options_map);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << CLI_USAGE << "\n" << options << std::endl;
        return 1;
    }

    if (options_map.count("help") || !options_map.count("command")) {
        std::cout << CLI_USAGE << "\n" << options << std::endl;
        return options_map.count("help") ? 0 : 1;
    }

    // Logging
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = options_map["printtoconsole"].as<bool>();
    if (options_map.count("debuglogfile")) {
        logger.m_file_path = options_map["debuglogfile"].as<std::string>();
        if (!logger.OpenDebugLog()) {
            std::cerr << "Error: cannot open debug log file " << logger.m_file_path << std::endl;
            return 1;
        }
        logger.m_print_to_file = true;
    }
    if (options_map.count("debug")) {
        for (const std::string& category : options_map["debug"].as<std::vector<std::string>>()) {
            if (!logger.EnableCategory(category)) {
                std::cerr << "Error: unsupported logging category --debug=" << category << std::endl;
                return 1;
            }
        }
    }

    const std::string strCommand = options_map["command"].as<std::string>();

    if (strCommand == "help") {
        std::string strTopic;
        if (options_map.count("args")) {
            const std::vector<std::string>& args = options_map["args"].as<std::vector<std::string>>();
            if (!args.empty()) {
                strTopic = args[0] == "distribute" ? "qfdistribute" : args[0] == "round" ? "qfrunround" : args[0];
            }
        }
        std::cout << tableRPC.help(strTopic) << std::endl;
        return 0;
    }

    std::string strMethod;
    if (strCommand == "distribute") {
        strMethod = "qfdistribute";
    } else if (strCommand == "round") {
        strMethod = "qfrunround";
    } else {
        std::cerr << "Error: unknown command " << strCommand << "\n\n" << CLI_USAGE << std::endl;
        return 1;
    }

    const std::string strInputPath = options_map["input"].as<std::string>();
    std::string strInput;
    if (!ReadInput(strInputPath, strInput)) {
        std::cerr << "Error: cannot read input " << strInputPath << std::endl;
        return 1;
    }

    UniValue input;
    if (!input.read(strInput) || !input.isObject()) {
        std::cerr << "Error: input is not a JSON object" << std::endl;
        return 1;
    }

    if (strMethod == "qfdistribute") {
        if (options_map["unconstrained"].as<bool>() && options_map.count("budget")) {
            std::cerr << "Error: --budget and --unconstrained exclude each other" << std::endl;
            return 1;
        }
        if (options_map["unconstrained"].as<bool>()) {
            input = WithoutKey(input, "budget");
        } else if (options_map.count("budget")) {
            const std::string strBudget = options_map["budget"].as<std::string>();
            CAmount budget;
            if (!ParseAmount(strBudget, budget)) {
                std::cerr << "Error: invalid budget " << strBudget << std::endl;
                return 1;
            }
            input = WithoutKey(input, "budget");
            input.pushKV("budget", FormatAmount(budget));
        }
    } else if (options_map.count("budget") || options_map["unconstrained"].as<bool>()) {
        std::cerr << "Error: --budget and --unconstrained only apply to distribute" << std::endl;
        return 1;
    }

    LogPrint(BCLog::RPC, "qfund-cli: command=%s input=%s\n", strCommand, strInputPath);

    return CommandLineRPC(strMethod, input);
}
