/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_Error_hpp
#define libhoist_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libhoist/LogLevel.hpp"

namespace libhoist {

/**
 * Exception carrying an error trace: one entry (message, file, line, function) per
 * stack frame that contributed context while the error propagated.
 *
 * Throw with HOIST_THROW_ERROR or HOIST_THROW_TYPED_ERROR. Add context to a caught
 * exception with HOIST_RETHROW_ERROR, which keeps the dynamic type of a libhoist::Error
 * and converts any other std::exception into one.
 *
 * The log level tells the top-level handler how loud the failure should be, e.g. a
 * usage error already reported to the user is raised at INFO.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    // the message of the innermost failure
    const char* what() const noexcept override {
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) { errorTrace.push_back(entry); }
    const std::vector<ErrorTraceEntry>& getErrorTrace() const { return errorTrace; }

    LogLevel getLogLevel() const { return logLevel; }
    void setLogLevel(LogLevel value) { logLevel = value; }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

// Error kinds surfaced by the push operations.

// The requested image is not present in the local repository
class ImageNotFoundError : public Error {
public:
    using Error::Error;
};

// An explicit tag was combined with an all-tags push
class ConflictingTagError : public Error {
public:
    using Error::Error;
};

// The push mode is not supported by the destination transport
class UnsupportedModeError : public Error {
public:
    using Error::Error;
};

// The destination could not be parsed, not even with the default transport
class TransportResolutionError : public Error {
public:
    using Error::Error;
};

// The copy engine failed to transfer the image
class CopyError : public Error {
public:
    using Error::Error;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

/**
 * Must be called from a handler, with "exception" being the exception currently handled.
 * A libhoist::Error gets the entry appended and is rethrown as is; any other exception
 * becomes a libhoist::Error whose trace starts with its what().
 */
[[noreturn]] void rethrowWithTraceEntry(const std::exception& exception,
                                        const Error::ErrorTraceEntry& entry,
                                        const boost::optional<LogLevel>& logLevel);

}


#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define HOIST_ERROR_TRACE_ENTRY(errorMessage) \
    libhoist::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}


// HOIST_THROW_ERROR(message[, logLevel])
#define HOIST_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define HOIST_THROW_ERROR_2(errorMessage, logLevel) \
    throw libhoist::Error{logLevel, HOIST_ERROR_TRACE_ENTRY(errorMessage)}

#define HOIST_THROW_ERROR_1(errorMessage) HOIST_THROW_ERROR_2(errorMessage, libhoist::LogLevel::ERROR)

#define HOIST_THROW_ERROR(...) HOIST_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, HOIST_THROW_ERROR_2, HOIST_THROW_ERROR_1)(__VA_ARGS__)


// HOIST_THROW_TYPED_ERROR(ErrorType, message)
#define HOIST_THROW_TYPED_ERROR(ErrorType, errorMessage) { \
    static_assert(std::is_base_of<libhoist::Error, ErrorType>::value, "error type must derive from libhoist::Error"); \
    throw ErrorType{libhoist::LogLevel::ERROR, HOIST_ERROR_TRACE_ENTRY(errorMessage)}; \
}


// HOIST_RETHROW_ERROR(exception, message[, logLevel])
#define HOIST_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define HOIST_RETHROW_ERROR_3(exception, errorMessage, logLevel) \
    libhoist::rethrowWithTraceEntry(exception, HOIST_ERROR_TRACE_ENTRY(errorMessage), boost::optional<libhoist::LogLevel>{logLevel})

#define HOIST_RETHROW_ERROR_2(exception, errorMessage) \
    libhoist::rethrowWithTraceEntry(exception, HOIST_ERROR_TRACE_ENTRY(errorMessage), boost::none)

#define HOIST_RETHROW_ERROR(...) HOIST_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, HOIST_RETHROW_ERROR_3, HOIST_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
