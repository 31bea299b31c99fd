/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"


namespace hoist {
namespace cli {
namespace utility {

using ArgIterator = libhoist::CLIArguments::const_iterator;

static bool hasDashPrefix(const std::string& s) {
    return s.size() > 1 && s[0]=='-' && s[1]!='-';
}

static bool hasDashDashPrefix(const std::string& s) {
    return s.size() > 2 && s.compare(0, 2, "--") == 0 && s[2]!='-';
}

static bool isOption(const std::string& s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    return option->semantic()->max_tokens() > 0;
}

// Adds the option and, if the next token is not an option, the next token as its value
static ArgIterator addOptionWithPossibleValue(ArgIterator arg, ArgIterator argsEnd, libhoist::CLIArguments& group) {
    group.push_back(*arg);

    auto next = arg+1;
    if (next != argsEnd && !hasDashPrefix(*next)) {
        group.push_back(*next);
        ++arg;
    }

    return arg;
}

static ArgIterator processLongOption(ArgIterator arg, ArgIterator argsEnd, libhoist::CLIArguments& group,
                                     const boost::program_options::options_description& optionsDescription) {
    const auto& argString = *arg;

    // "--option=value"
    if(argString.find('=') != std::string::npos) {
        group.push_back(argString);
        return arg;
    }

    // unknown options are kept so that boost::program_options reports them
    auto option = optionsDescription.find_nothrow(argString.substr(2), false);
    if(option && optionTakesValue(option)) {
        return addOptionWithPossibleValue(arg, argsEnd, group);
    }

    group.push_back(*arg);
    return arg;
}

// Short options may be stuck together ("-ab"), the last one possibly taking a value
static ArgIterator processShortOptions(ArgIterator arg, ArgIterator argsEnd, libhoist::CLIArguments& group,
                                       const boost::program_options::options_description& optionsDescription) {
    auto letters = arg->substr(1);

    for(auto it = letters.cbegin(); it != letters.cend(); ++it) {
        auto option = optionsDescription.find_nothrow(std::string{"-"} + *it, false);
        bool isLastLetter = it+1 == letters.cend();

        if(!option) {
            group.push_back(*arg);
            break;
        }

        if(optionTakesValue(option)) {
            if(isLastLetter) {
                arg = addOptionWithPossibleValue(arg, argsEnd, group);
            }
            else {
                group.push_back(*arg); // value is stuck to the option
                break;
            }
        }
        else if(isLastLetter) {
            group.push_back(*arg);
        }
    }

    return arg;
}

/**
 * Splits the arguments in two groups:
 * 1. the program/command name followed by its options and their values;
 * 2. everything from the first positional argument onwards (subcommand and its arguments).
 * E.g. "hoist --verbose push --all-tags image" becomes ("hoist --verbose", "push --all-tags image").
 * Options are recognized with the UNIX style of boost::program_options.
 */
std::tuple<libhoist::CLIArguments, libhoist::CLIArguments> groupOptionsAndPositionalArguments(
        const libhoist::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libhoist::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libhoist::CLIArguments, libhoist::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    if(isOption(args[0])) {
        auto message = boost::format("Expected a program or command name as first argument, got '%s'") % args[0];
        throwUsageError(message.str());
    }
    nameAndOptionArgs.push_back(args[0]);

    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libhoist::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processLongOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else {
            arg = processShortOptions(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libhoist::CLIArguments, libhoist::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libhoist::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min) {
        throwUsageError((boost::format("Too few arguments for command '%s'") % command).str(), command);
    }
    if(numberOfArguments > max) {
        throwUsageError((boost::format("Too many arguments for command '%s'") % command).str(), command);
    }
}

void throwUsageError(const std::string& message, const std::string& command) {
    auto hint = command.empty() ? std::string{"See 'hoist help'"} : "See 'hoist help " + command + "'";
    auto fullMessage = message + "\n" + hint;
    printLog(fullMessage, libhoist::LogLevel::GENERAL, std::cerr);
    HOIST_THROW_ERROR(fullMessage, libhoist::LogLevel::INFO);
}

void printLog(const std::string& message, libhoist::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    libhoist::Logger::getInstance().log(message, "CLI", LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libhoist::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
