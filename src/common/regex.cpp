/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/regex.hpp"

#include <sstream>
#include <initializer_list>


namespace hoist {
namespace common {
namespace regex {

namespace {

std::string concatenate(std::initializer_list<std::string> expressions) {
    auto output = std::stringstream{};
    for (const auto& expression : expressions) {
        output << expression;
    }
    return output.str();
}

std::string group(const std::string& expression) {
    return "(?:" + expression + ")";
}

std::string optional(const std::string& expression) {
    return group(expression) + "?";
}

std::string repeated(const std::string& expression) {
    return group(expression) + "+";
}

std::string capture(const std::string& expression) {
    return "(" + expression + ")";
}

std::string anchored(const std::string& expression) {
    return "^" + expression + "$";
}

// lower case letters and digits only
const std::string alphaNumeric{"[a-z0-9]+"};

// one period, one or two underscores, or any number of dashes
const std::string separator{"(?:[._]|__|[-]+)"};

const std::string pathComponent = concatenate({alphaNumeric, optional(repeated(separator + alphaNumeric))});

const std::string domainNameComponent{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};

// compressed or uncompressed IPv6 in brackets (RFC 5952), no zone identifiers
const std::string ipv6Address{"\\[(?:[a-fA-F0-9:]+)\\]"};

const std::string port{"\\:[0-9]+"};

const std::string domainName = concatenate({domainNameComponent, optional(repeated("\\." + domainNameComponent))});

const std::string domain = group(concatenate({domainName, "|", ipv6Address})) + optional(port);

const std::string remoteName = concatenate({pathComponent, optional(repeated("\\/" + pathComponent))});

const std::string namePattern = concatenate({optional(domain + "\\/"), remoteName});

const std::string tagPattern{"[\\w][\\w.-]{0,127}"};

const std::string digestPattern{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};

const std::string referencePattern = anchored(capture(namePattern)
                                              + optional("\\:" + capture(tagPattern))
                                              + optional("\\@" + capture(digestPattern)));

} // namespace

const boost::regex name(namePattern);
const boost::regex tag(tagPattern);
const boost::regex digest(digestPattern);
const boost::regex reference(referencePattern);

} // namespace
} // namespace
} // namespace
