/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_transport_TransportRegistry_hpp
#define hoist_transport_TransportRegistry_hpp

#include <string>
#include <map>
#include <functional>

#include <boost/optional.hpp>

#include "transport/Reference.hpp"


namespace hoist {
namespace transport {

/**
 * Outcome of parsing a transport URI. Exactly one of 'reference' and 'error' is set.
 */
struct ParseResult {
    boost::optional<Reference> reference;
    std::string error;

    explicit operator bool() const { return static_cast<bool>(reference); }
};

class TransportRegistry {
public:
    virtual ~TransportRegistry() = default;
    virtual ParseResult parse(const std::string& uri) const = 0;
};

/**
 * The transports understood by Skopeo that hoist can push to.
 */
class BuiltinTransportRegistry : public TransportRegistry {
public:
    BuiltinTransportRegistry();
    ParseResult parse(const std::string& uri) const override;

private:
    // returns an empty string if the location is valid, the error otherwise
    using LocationValidator = std::function<std::string(const std::string&)>;

    static std::string validateRegistryLocation(const std::string& location);
    static std::string validateArchiveLocation(const std::string& location);
    static std::string validatePathLocation(const std::string& location);

private:
    std::map<std::string, LocationValidator> validators;
};

}
}

#endif
