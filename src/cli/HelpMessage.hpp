/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_HelpMessage_hpp
#define hoist_cli_HelpMessage_hpp

#include <ostream>
#include <memory>
#include <string>
#include <vector>
#include <utility>

#include <boost/program_options.hpp>


namespace hoist {
namespace cli {

// Builder of the "hoist help COMMAND" output
class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addExample(const std::string& commandLine, const std::string& explanation);

private:
    std::string usage;
    std::string description;
    // options_description is not copy assignable
    std::shared_ptr<const boost::program_options::options_description> optionsDescription;
    std::vector<std::pair<std::string, std::string>> examples;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
