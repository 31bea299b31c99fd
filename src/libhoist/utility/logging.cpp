/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "logging.hpp"

namespace libhoist {

void logMessage(const std::string& message, LogLevel level, std::ostream& out, std::ostream& err) {
    Logger::getInstance().log(message, "Utility", level, out, err);
}

void logMessage(const boost::format& message, LogLevel level, std::ostream& out, std::ostream& err) {
    logMessage(message.str(), level, out, err);
}

}
