/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_Event_hpp
#define hoist_push_Event_hpp

#include <string>
#include <chrono>
#include <memory>


namespace hoist {
namespace push {

enum class EventType { ImagePush };

std::string eventTypeToString(EventType);

struct Event {
    std::string imageID;
    std::string name;
    std::chrono::system_clock::time_point time;
    EventType type;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event&) = 0;
};

// Emits an event when destroyed, i.e. on every exit path of the enclosing scope.
// Failures to emit are logged and never propagated.
class ScopedEventEmission {
public:
    ScopedEventEmission(std::shared_ptr<EventSink> sink, const std::string& imageID,
                        const std::string& name, EventType type);
    ScopedEventEmission(const ScopedEventEmission&) = delete;
    ScopedEventEmission& operator=(const ScopedEventEmission&) = delete;
    ~ScopedEventEmission();

private:
    void logEmissionFailure(const char* reason) const noexcept;

    std::shared_ptr<EventSink> sink;
    std::string imageID;
    std::string name;
    EventType type;
};

}
}

#endif
