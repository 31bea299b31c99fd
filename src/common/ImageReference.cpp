/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageReference.hpp"

#include <tuple>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/utility/logging.hpp"
#include "common/regex.hpp"


namespace hoist {
namespace common {

const std::string ImageReference::DEFAULT_SERVER{"index.docker.io"};
const std::string ImageReference::DEFAULT_REPOSITORY_NAMESPACE{"library"};
const std::string ImageReference::DEFAULT_TAG{"latest"};

std::string ImageReference::getFullName() const {
    return server + "/" + repositoryNamespace + "/" + image;
}

std::string ImageReference::string() const {
    auto output = getFullName();
    if(!tag.empty()) {
        output += ":" + tag;
    }
    if(!digest.empty()) {
        output += "@" + digest;
    }
    return output;
}

// a digest pins the content, any tag next to it is dropped
ImageReference ImageReference::normalize() const {
    auto output = *this;
    if(!digest.empty()) {
        output.tag.clear();
    }
    return output;
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return std::tie(lhs.server, lhs.repositoryNamespace, lhs.image, lhs.tag, lhs.digest)
        == std::tie(rhs.server, rhs.repositoryNamespace, rhs.image, rhs.tag, rhs.digest);
}

bool operator!=(const ImageReference& lhs, const ImageReference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

// The first path component is a registry host if it looks like one,
// the same heuristic used by the Docker CLI.
static bool isServerComponent(const std::string& component) {
    return component.find_first_of(".:") != std::string::npos
        || component == "localhost";
}

/**
 * Parse server, namespace and individual image name from a string matching regex::name
 */
static std::tuple<std::string, std::string, std::string> parseNameMatch(const std::string& in) {
    auto server = ImageReference::DEFAULT_SERVER;
    auto repositoryNamespace = ImageReference::DEFAULT_REPOSITORY_NAMESPACE;
    auto image = std::string{};
    auto first_separator = in.find_first_of("/");
    auto last_separator = in.find_last_of("/");

    // No separators found: input is short image name
    if (last_separator == std::string::npos){
        image = in;
    }
    // Only one separator: input is "namespace/image" or "server/image"
    else if (first_separator == last_separator){
        auto firstComponent = in.substr(0, first_separator);
        if (isServerComponent(firstComponent)) {
            server = firstComponent;
        }
        else {
            repositoryNamespace = firstComponent;
        }
        image = in.substr(last_separator+1);
    }
    // Two or more separators
    else {
        server = in.substr(0, first_separator);
        repositoryNamespace = in.substr(first_separator + 1, last_separator - first_separator - 1);
        image = in.substr(last_separator+1);
    }

    return std::tuple<std::string, std::string, std::string>{server, repositoryNamespace, image};
}

/**
 * An invalid image reference contains the pattern "..", which could
 * be exploited to address data outside the local repository when
 * the reference is turned into a path.
 */
bool isValidImageReference(const std::string& imageReference) {
    return imageReference.find("..") == std::string::npos;
}

/**
 * Parse a named reference ("[server/][namespace/]image[:tag][@digest]") without
 * applying the default tag, so that callers can tell whether a tag was given.
 * Returns boost::none if the input is not a valid named reference.
 */
boost::optional<ImageReference> parseNamedReference(const std::string& input) {
    if(!isValidImageReference(input)) {
        return boost::none;
    }

    boost::smatch matches;
    if (!boost::regex_match(input, matches, regex::reference)) {
        return boost::none;
    }

    auto reference = ImageReference{};
    std::tie(reference.server, reference.repositoryNamespace, reference.image) = parseNameMatch(matches[1]);
    if (matches[2].matched) {
        reference.tag = matches[2].str();
    }
    if (matches[3].matched) {
        reference.digest = matches[3].str();
    }
    return reference;
}

/**
 * Parse the input reference of a container image, completing it with the default tag
 * when neither a tag nor a digest is present
 */
ImageReference parseImageReference(const std::string& input) {
    libhoist::logMessage(boost::format("Parsing image reference from string: %s") % input, libhoist::LogLevel::DEBUG);

    if(!isValidImageReference(input)) {
        auto message = boost::format("Invalid image reference '%s'\n"
                                     "Image references are not allowed to contain the sequence '..'") % input;
        HOIST_THROW_ERROR(message.str());
    }

    auto reference = parseNamedReference(input);
    if (!reference) {
        auto message = boost::format("Invalid image reference '%s'") % input;
        HOIST_THROW_ERROR(message.str());
    }

    // If there is a digest, the tag does not matter
    if (reference->tag.empty() && reference->digest.empty()) {
        reference->tag = ImageReference::DEFAULT_TAG;
    }

    libhoist::logMessage(boost::format("Successfully parsed image reference %s") % *reference, libhoist::LogLevel::DEBUG);
    return *reference;
}

}
}
