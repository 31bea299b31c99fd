/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_Logger_hpp
#define libhoist_Logger_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libhoist/LogLevel.hpp"
#include "libhoist/Error.hpp"

namespace libhoist {

/**
 * Process-wide logger.
 *
 * Messages below the configured level are discarded. A message is prefixed with
 * "[UTC time] [hostname-pid] [subsystem] [LEVEL] ", except GENERAL messages which
 * are printed as they are (they are meant for the user, e.g. help and version).
 * WARN and ERROR go to the error stream, everything else to the output stream.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libhoist::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libhoist::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libhoist::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libhoist::LogLevel logLevel) { level = logLevel; }
    libhoist::LogLevel getLevel() const { return level; }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string makePrefix(libhoist::LogLevel, const std::string& sysName) const;

private:
    libhoist::LogLevel level = libhoist::LogLevel::WARN;
};

const char* toString(libhoist::LogLevel);

}

#endif
