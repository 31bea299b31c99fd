/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_logging_hpp
#define libhoist_utility_logging_hpp

#include <string>

#include <boost/format.hpp>

#include "libhoist/Logger.hpp"

namespace libhoist {

// Logs under the "Utility" subsystem, for code that has no subsystem of its own
void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
