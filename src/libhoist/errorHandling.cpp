/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>
#include <typeinfo>

namespace libhoist {

std::string getExceptionTypeString(const std::exception& e) {
    if(dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    if(dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    if(dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    if(dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    if(dynamic_cast<const std::bad_alloc*>(&e)) {
        return "bad alloc";
    }
    return "generic exception";
}

void rethrowWithTraceEntry(const std::exception& exception,
                           const Error::ErrorTraceEntry& entry,
                           const boost::optional<LogLevel>& logLevel) {
    if(const auto* error = dynamic_cast<const Error*>(&exception)) {
        // the exception object of the active handler is never const itself
        auto* mutableError = const_cast<Error*>(error);
        if(logLevel) {
            mutableError->setLogLevel(*logLevel);
        }
        mutableError->appendErrorTraceEntry(entry);
        throw;
    }

    auto origin = Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, getExceptionTypeString(exception)};
    auto error = Error{logLevel ? *logLevel : LogLevel::ERROR, origin};
    error.appendErrorTraceEntry(entry);
    throw error;
}

}
