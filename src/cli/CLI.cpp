/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CLI.hpp"

#include <string>
#include <tuple>

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace hoist {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libhoist::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = utility::groupOptionsAndPositionalArguments(args, optionsDescription);

    auto values = parseGlobalOptions(nameAndOptionArgs);
    setLogLevel(values);

    auto factory = CommandObjectsFactory{};

    // --help and --version override the command
    if(values.count("help")) {
        return factory.makeCommandObject("help", libhoist::CLIArguments{"help"}, std::move(conf));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libhoist::CLIArguments{"version"}, std::move(conf));
    }
    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help", libhoist::CLIArguments{"help"}, std::move(conf));
    }

    return factory.makeCommandObject(positionalArgs[0], positionalArgs, std::move(conf));
}

boost::program_options::variables_map CLI::parseGlobalOptions(const libhoist::CLIArguments& nameAndOptionArgs) const {
    boost::program_options::variables_map values;
    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values);
    }
    catch(const boost::program_options::error& e) {
        utility::throwUsageError(e.what());
    }
    return values;
}

void CLI::setLogLevel(const boost::program_options::variables_map& values) {
    auto level = libhoist::LogLevel::WARN;
    if(values.count("debug")) {
        level = libhoist::LogLevel::DEBUG;
    }
    else if(values.count("verbose")) {
        level = libhoist::LogLevel::INFO;
    }
    libhoist::Logger::getInstance().setLevel(level);
}

}
}
