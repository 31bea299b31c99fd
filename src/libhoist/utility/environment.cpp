/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <cstdlib>

#include <boost/format.hpp>

#include "libhoist/utility/logging.hpp"

namespace libhoist {
namespace environment {

boost::optional<std::string> getVariable(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if(value == nullptr) {
        logMessage(boost::format("Environment variable %s is not set") % key, LogLevel::DEBUG);
        return boost::none;
    }
    logMessage(boost::format("Environment variable %s=%s") % key % value, LogLevel::DEBUG);
    return std::string{value};
}

}}
