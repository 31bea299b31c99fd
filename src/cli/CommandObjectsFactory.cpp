/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CommandObjectsFactory.hpp"

#include <boost/format.hpp>

#include "cli/Utility.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandPush.hpp"
#include "cli/CommandVersion.hpp"


namespace hoist {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandPush>("push");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return entries.count(commandName) > 0;
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    for(const auto& entry : entries) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return findEntry(commandName).makeDescriptive();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libhoist::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    return findEntry(commandName).makeExecutable(commandArgs, std::move(config));
}

const CommandObjectsFactory::Entry& CommandObjectsFactory::findEntry(const std::string& commandName) const {
    auto it = entries.find(commandName);
    if(it == entries.cend()) {
        utility::throwUsageError((boost::format("'%s' is not a hoist command") % commandName).str());
    }
    return it->second;
}

}
}
