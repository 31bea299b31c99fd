/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_Command_hpp
#define hoist_cli_Command_hpp

#include <string>

namespace hoist {
namespace cli {

/**
 * A hoist subcommand. Commands are built twice by the factory: without
 * arguments, to describe themselves in the help, and with their command
 * line, which they parse and validate in the constructor.
 */
class Command {
public:
    virtual ~Command() = default;
    virtual void execute() = 0;
    virtual std::string getBriefDescription() const = 0;
    virtual void printHelpMessage() const = 0;
};

}
}

#endif
