/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_EventLog_hpp
#define hoist_push_EventLog_hpp

#include <string>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libhoist/LogLevel.hpp"
#include "push/Event.hpp"


namespace hoist {
namespace push {

/**
 * Appends events to a file, one JSON object per line.
 */
class EventLog : public EventSink {
public:
    EventLog(const boost::filesystem::path& file);
    void emit(const Event&) override;
    const boost::filesystem::path& getFile() const { return file; }

private:
    void printLog(const boost::format& message, libhoist::LogLevel,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;
    void printLog(const std::string& message, libhoist::LogLevel,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;

private:
    const std::string sysname = "EventLog";
    boost::filesystem::path file;
    unsigned int lockTimeoutMs = 10000;
};

std::string formatTimeRFC3339(std::chrono::system_clock::time_point);

}
}

#endif
