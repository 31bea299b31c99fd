/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "push/DestinationResolver.hpp"

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"


namespace hoist {
namespace push {

DestinationResolver::DestinationResolver(std::shared_ptr<const transport::TransportRegistry> registry,
                                         const std::string& defaultTransport)
    : registry{std::move(registry)}
    , defaultTransport{defaultTransport}
{}

transport::ParseResult DestinationResolver::tryResolve(const std::string& destination) const {
    auto result = registry->parse(destination);
    if(result) {
        return result;
    }

    auto fallback = registry->parse(defaultTransport + destination);
    if(fallback) {
        auto message = boost::format("Resolved destination '%s' with default transport to %s")
            % destination % *fallback.reference;
        libhoist::Logger::getInstance().log(message, sysname, libhoist::LogLevel::DEBUG);
        return fallback;
    }

    // the error of the first attempt is reported
    return result;
}

transport::Reference DestinationResolver::resolve(const std::string& destination) const {
    auto result = tryResolve(destination);
    if(!result) {
        auto message = boost::format("Failed to resolve destination '%s': %s") % destination % result.error;
        HOIST_THROW_TYPED_ERROR(libhoist::TransportResolutionError, message.str());
    }
    return *result.reference;
}

}
}
