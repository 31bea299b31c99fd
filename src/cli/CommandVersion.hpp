/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_CommandVersion_hpp
#define hoist_cli_CommandVersion_hpp

#include <iostream>
#include <memory>
#include <tuple>

#include <boost/program_options.hpp>

#include "libhoist/Logger.hpp"
#include "libhoist/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"


namespace hoist {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libhoist::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        auto noOptions = boost::program_options::options_description{};
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = utility::groupOptionsAndPositionalArguments(args, noOptions);

        if(nameAndOptionArgs.argc() > 1) {
            utility::throwUsageError("Command 'version' doesn't support options", "version");
        }
        utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");
    }

    void execute() override {
        libhoist::Logger::getInstance().log(conf->buildTime.version, "CommandVersion", libhoist::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the hoist version information";
    }

    void printHelpMessage() const override {
        std::cout << cli::HelpMessage()
            .setUsage("hoist version")
            .setDescription(getBriefDescription());
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
