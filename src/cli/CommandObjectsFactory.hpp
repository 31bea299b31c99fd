/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_CommandObjectsFactory_hpp
#define hoist_cli_CommandObjectsFactory_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>

#include "common/Config.hpp"
#include "libhoist/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace hoist {
namespace cli {

class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    bool isValidCommandName(const std::string& commandName) const;
    // sorted
    std::vector<std::string> getCommandNames() const;
    // command to be described, e.g. in the help message
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    // command to be executed: commandArgs starts with the command name
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libhoist::CLIArguments& commandArgs,
                                                    std::shared_ptr<common::Config> config) const;

private:
    struct Entry {
        std::function<std::unique_ptr<cli::Command>()> makeDescriptive;
        std::function<std::unique_ptr<cli::Command>(const libhoist::CLIArguments&,
                                                    std::shared_ptr<common::Config>)> makeExecutable;
    };

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        auto entry = Entry{};
        entry.makeDescriptive = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        entry.makeExecutable = [](const libhoist::CLIArguments& args, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<cli::Command>{new CommandType{args, std::move(config)}};
        };
        entries.emplace(commandName, std::move(entry));
    }

    const Entry& findEntry(const std::string& commandName) const;

private:
    std::map<std::string, Entry> entries;
};

}
}

#endif
