/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/HelpMessage.hpp"


namespace hoist {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    this->optionsDescription = std::make_shared<boost::program_options::options_description>(optionsDescription);
    return *this;
}

HelpMessage& HelpMessage::addExample(const std::string& commandLine, const std::string& explanation) {
    examples.emplace_back(commandLine, explanation);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& message) {
    os << "Usage: " << message.usage << "\n\n" << message.description << "\n";

    if(message.optionsDescription && !message.optionsDescription->options().empty()) {
        os << "\n" << *message.optionsDescription;
    }

    if(!message.examples.empty()) {
        os << "\nExamples:\n";
        for(const auto& example : message.examples) {
            os << "   # " << example.second << "\n"
               << "   " << example.first << "\n";
        }
    }
    return os;
}

}
}
