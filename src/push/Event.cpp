/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "push/Event.hpp"

#include <boost/format.hpp>

#include "libhoist/Logger.hpp"


namespace hoist {
namespace push {

std::string eventTypeToString(EventType type) {
    switch(type) {
        case EventType::ImagePush:
            return "push";
    }
    return "unknown";
}

ScopedEventEmission::ScopedEventEmission(std::shared_ptr<EventSink> sink, const std::string& imageID,
                                         const std::string& name, EventType type)
    : sink{std::move(sink)}
    , imageID{imageID}
    , name{name}
    , type{type}
{}

ScopedEventEmission::~ScopedEventEmission() {
    if(!sink) {
        return;
    }

    try {
        sink->emit(Event{imageID, name, std::chrono::system_clock::now(), type});
    }
    catch(const std::exception& e) {
        logEmissionFailure(e.what());
    }
    catch(...) {
        logEmissionFailure("unknown error");
    }
}

// Runs in a destructor, possibly during unwinding: nothing may escape
void ScopedEventEmission::logEmissionFailure(const char* reason) const noexcept {
    try {
        auto message = boost::format("Failed to record %s event of image %s to %s: %s")
            % eventTypeToString(type) % imageID % name % reason;
        libhoist::Logger::getInstance().log(message, "EventSink", libhoist::LogLevel::WARN);
    }
    catch(...) {
    }
}

}
}
