/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_CLI_hpp
#define hoist_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "libhoist/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace hoist {
namespace cli {

/**
 * Parses the global options (which also set the log level) and hands the
 * rest of the command line to the selected command.
 */
class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libhoist::CLIArguments&, std::shared_ptr<common::Config>) const;
    const boost::program_options::options_description& getOptionsDescription() const { return optionsDescription; }

private:
    boost::program_options::variables_map parseGlobalOptions(const libhoist::CLIArguments& nameAndOptionArgs) const;
    static void setLogLevel(const boost::program_options::variables_map&);

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
