/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/TransportRegistry.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "common/ImageReference.hpp"
#include "common/regex.hpp"


namespace hoist {
namespace transport {

static ParseResult makeError(const boost::format& message) {
    return ParseResult{ boost::none, message.str() };
}

BuiltinTransportRegistry::BuiltinTransportRegistry()
    : validators{
        {REGISTRY_TRANSPORT, validateRegistryLocation},
        {ARCHIVE_TRANSPORT, validateArchiveLocation},
        {OCI_LAYOUT_TRANSPORT, validatePathLocation},
        {"oci-archive", validatePathLocation},
        {"dir", validatePathLocation}
    }
{}

ParseResult BuiltinTransportRegistry::parse(const std::string& uri) const {
    auto separator = uri.find(':');
    if(separator == std::string::npos) {
        return makeError(boost::format{"Invalid image name \"%s\", expected colon-separated transport:reference"} % uri);
    }

    auto transportName = uri.substr(0, separator);
    auto location = uri.substr(separator + 1);

    auto it = validators.find(transportName);
    if(it == validators.cend()) {
        return makeError(boost::format{"Invalid transport \"%s\" in image name \"%s\""} % transportName % uri);
    }

    auto locationError = it->second(location);
    if(!locationError.empty()) {
        return makeError(boost::format{"Invalid image name \"%s\": %s"} % uri % locationError);
    }

    return ParseResult{ Reference{transportName, location}, "" };
}

std::string BuiltinTransportRegistry::validateRegistryLocation(const std::string& location) {
    if(location.compare(0, 2, "//") != 0) {
        return "docker: image reference does not start with //";
    }

    auto imageReference = location.substr(2);
    if(!common::isValidImageReference(imageReference)
       || !boost::regex_match(imageReference, common::regex::reference)) {
        return (boost::format{"invalid reference format \"%s\""} % imageReference).str();
    }

    return {};
}

// <path>[:<reference>]
std::string BuiltinTransportRegistry::validateArchiveLocation(const std::string& location) {
    auto separator = location.find(':');
    auto path = location.substr(0, separator);
    if(path.empty()) {
        return "docker-archive reference must not have an empty path";
    }

    if(separator != std::string::npos) {
        auto imageReference = location.substr(separator + 1);
        if(!common::parseNamedReference(imageReference)) {
            return (boost::format{"invalid reference format \"%s\""} % imageReference).str();
        }
    }

    return {};
}

std::string BuiltinTransportRegistry::validatePathLocation(const std::string& location) {
    if(location.empty()) {
        return "path must not be empty";
    }
    return {};
}

}
}
