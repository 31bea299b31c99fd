/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_Utility_hpp
#define hoist_cli_Utility_hpp

#include <string>
#include <tuple>
#include <iostream>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libhoist/LogLevel.hpp"
#include "libhoist/CLIArguments.hpp"

namespace hoist {
namespace cli {
namespace utility {

std::tuple<libhoist::CLIArguments, libhoist::CLIArguments> groupOptionsAndPositionalArguments(
        const libhoist::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libhoist::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

/**
 * Shows the message to the user, followed by a pointer to the help of the command
 * (or to the general help if no command is given), then throws an error at INFO level:
 * the user already got the explanation, the error trace is only shown in verbose mode.
 */
[[noreturn]] void throwUsageError(const std::string& message, const std::string& command = {});

void printLog(  const std::string& message, libhoist::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libhoist::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
