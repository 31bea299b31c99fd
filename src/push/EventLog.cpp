/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "push/EventLog.hpp"

#include <ctime>

#include <rapidjson/document.h>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/Lockfile.hpp"
#include "libhoist/Utility.hpp"


namespace rj = rapidjson;

namespace hoist {
namespace push {

EventLog::EventLog(const boost::filesystem::path& file)
    : file{file}
{}

void EventLog::emit(const Event& event) {
    printLog(boost::format("Recording %s event of image %s to %s")
             % eventTypeToString(event.type) % event.imageID % event.name, libhoist::LogLevel::DEBUG);

    auto record = rj::Document{rj::kObjectType};
    auto& allocator = record.GetAllocator();
    record.AddMember("id", rj::Value{event.imageID.c_str(), allocator}, allocator);
    record.AddMember("name", rj::Value{event.name.c_str(), allocator}, allocator);
    record.AddMember("time", rj::Value{formatTimeRFC3339(event.time).c_str(), allocator}, allocator);
    record.AddMember("type", rj::Value{eventTypeToString(event.type).c_str(), allocator}, allocator);

    try {
        auto directory = file.parent_path();
        libhoist::filesystem::createFoldersIfNecessary(directory);
        if(!boost::filesystem::is_directory(directory)) {
            auto message = boost::format("%s is not a directory") % directory;
            HOIST_THROW_ERROR(message.str());
        }
        libhoist::Lockfile lock{file, lockTimeoutMs};
        libhoist::filesystem::writeTextFile(libhoist::json::serialize(record) + "\n", file, std::ios_base::app);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to append event to %s") % file;
        HOIST_RETHROW_ERROR(e, message.str());
    }
}

std::string formatTimeRFC3339(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    struct tm timeInfo;
    gmtime_r(&timeT, &timeInfo);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &timeInfo);
    return buffer;
}

void EventLog::printLog(const boost::format& message, libhoist::LogLevel logLevel,
                        std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), logLevel, outStream, errStream);
}

void EventLog::printLog(const std::string& message, libhoist::LogLevel logLevel,
                        std::ostream& outStream, std::ostream& errStream) const {
    libhoist::Logger::getInstance().log(message, sysname, logLevel, outStream, errStream);
}

}
}
