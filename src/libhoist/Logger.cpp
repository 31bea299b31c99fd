/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libhoist/Logger.hpp"

#include <chrono>
#include <ctime>
#include <unistd.h>

#include "libhoist/utility/process.hpp"

namespace libhoist {

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

void Logger::log(const std::string& message, const std::string& systemName, const libhoist::LogLevel& logLevel,
                 std::ostream& out_stream, std::ostream& err_stream) {
    if(logLevel < level) {
        return;
    }

    bool isError = logLevel == libhoist::LogLevel::WARN || logLevel == libhoist::LogLevel::ERROR;
    auto& stream = isError ? err_stream : out_stream;
    stream << makePrefix(logLevel, systemName) << message << std::endl;
}

void Logger::log(const boost::format& message, const std::string& systemName, const libhoist::LogLevel& logLevel,
                 std::ostream& out_stream, std::ostream& err_stream) {
    log(message.str(), systemName, logLevel, out_stream, err_stream);
}

void Logger::logErrorTrace(const libhoist::Error& error, const std::string& systemName, std::ostream& errStream) {
    if(error.getLogLevel() < level) {
        return;
    }

    log("Error trace (most nested error last):", systemName, LogLevel::ERROR, std::cout, errStream);

    const auto& trace = error.getErrorTrace();
    auto depth = size_t{0};
    for(auto entry = trace.crbegin(); entry != trace.crend(); ++entry, ++depth) {
        auto line = entry->fileLine != -1 ? std::to_string(entry->fileLine) : std::string{};
        errStream << boost::format("#%-3d %s at %s:%s %s\n")
            % depth % entry->functionName % entry->fileName % line % entry->errorMessage;
    }
}

std::string Logger::makePrefix(libhoist::LogLevel logLevel, const std::string& systemName) const {
    if(logLevel == libhoist::LogLevel::GENERAL) {
        return "";
    }

    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    auto utc = std::tm{};
    gmtime_r(&seconds, &utc);
    char time[32];
    std::strftime(time, sizeof(time), "%Y-%m-%dT%H:%M:%S", &utc);

    return (boost::format("[%s.%03dZ] [%s-%d] [%s] [%s] ")
        % time % millis
        % libhoist::process::getHostname() % getpid()
        % systemName
        % toString(logLevel)).str();
}

const char* toString(libhoist::LogLevel logLevel) {
    switch(logLevel) {
        case libhoist::LogLevel::DEBUG:   return "DEBUG";
        case libhoist::LogLevel::INFO:    return "INFO";
        case libhoist::LogLevel::WARN:    return "WARN";
        case libhoist::LogLevel::ERROR:   return "ERROR";
        case libhoist::LogLevel::GENERAL: return "GENERAL";
    }
    return "UNKNOWN";
}

}
