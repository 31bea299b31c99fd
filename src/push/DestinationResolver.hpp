/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_DestinationResolver_hpp
#define hoist_push_DestinationResolver_hpp

#include <string>
#include <memory>

#include "transport/TransportRegistry.hpp"


namespace hoist {
namespace push {

/**
 * Turns a destination string into a transport reference. A destination that
 * cannot be parsed as given is retried with the default transport prepended,
 * e.g. "quay.io/user/image:tag" becomes "docker://quay.io/user/image:tag".
 */
class DestinationResolver {
public:
    DestinationResolver(std::shared_ptr<const transport::TransportRegistry> registry,
                        const std::string& defaultTransport);

    transport::ParseResult tryResolve(const std::string& destination) const;
    // Throws libhoist::TransportResolutionError carrying the error of the first attempt
    transport::Reference resolve(const std::string& destination) const;

    const std::string& getDefaultTransport() const { return defaultTransport; }

private:
    std::shared_ptr<const transport::TransportRegistry> registry;
    std::string defaultTransport;
    const std::string sysname = "DestinationResolver";
};

}
}

#endif
