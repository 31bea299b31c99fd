/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_common_ImageReference_hpp
#define hoist_common_ImageReference_hpp

#include <string>
#include <ostream>

#include <boost/optional.hpp>


namespace hoist {
namespace common {

struct ImageReference {
    std::string server;
    std::string repositoryNamespace;
    std::string image;
    std::string tag;
    std::string digest;
    std::string getFullName() const;
    std::string string() const;
    ImageReference normalize() const;

    static const std::string DEFAULT_SERVER;
    static const std::string DEFAULT_REPOSITORY_NAMESPACE;
    static const std::string DEFAULT_TAG;
};

bool operator==(const ImageReference&, const ImageReference&);
bool operator!=(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

bool isValidImageReference(const std::string&);

boost::optional<ImageReference> parseNamedReference(const std::string& input);

ImageReference parseImageReference(const std::string& input);

}
}

#endif
