/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_CommandHelp_hpp
#define hoist_cli_CommandHelp_hpp

#include <iostream>
#include <memory>
#include <tuple>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "libhoist/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace hoist {
namespace cli {

// "hoist help" lists the commands, "hoist help COMMAND" prints the help of COMMAND
class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libhoist::CLIArguments& args, std::shared_ptr<common::Config>) {
        auto noOptions = boost::program_options::options_description{};
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = utility::groupOptionsAndPositionalArguments(args, noOptions);

        if(nameAndOptionArgs.argc() > 1) {
            utility::throwUsageError("Command 'help' doesn't support options", "help");
        }
        utility::validateNumberOfPositionalArguments(positionalArgs, 0, 1, "help");

        if(!positionalArgs.empty()) {
            topic = positionalArgs[0];
            if(!CommandObjectsFactory{}.isValidCommandName(*topic)) {
                utility::throwUsageError((boost::format("'%s' is not a hoist command") % *topic).str());
            }
        }
    }

    void execute() override {
        auto factory = CommandObjectsFactory{};

        if(topic) {
            factory.makeCommandObject(*topic)->printHelpMessage();
            return;
        }

        std::cout << "Usage: hoist [OPTIONS] COMMAND [ARGS]\n"
                  << "\n"
                  << cli::CLI{}.getOptionsDescription()
                  << "\n"
                  << "Commands:\n";
        for(const auto& name : factory.getCommandNames()) {
            std::cout << boost::format("   %-10s%s\n") % name % factory.makeCommandObject(name)->getBriefDescription();
        }
        std::cout << "\nRun 'hoist help COMMAND' for more information on a command\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        std::cout << cli::HelpMessage()
            .setUsage("hoist help [COMMAND]")
            .setDescription(getBriefDescription());
    }

    const boost::optional<std::string>& getTopic() const { return topic; }

private:
    boost::optional<std::string> topic;
};

}
}

#endif
