/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_image_store_Image_hpp
#define hoist_image_store_Image_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "common/ImageReference.hpp"
#include "transport/Reference.hpp"


namespace hoist {
namespace image_store {

struct Platform {
    std::string os;
    std::string architecture;
    std::string variant;
};

/**
 * An image stored in the local repository.
 */
class Image {
public:
    virtual ~Image() = default;
    virtual const std::string& getID() const = 0;
    // Where the image content can be read from, e.g. an OCI layout
    virtual transport::Reference getStorageReference() const = 0;
    // The image's names that carry a tag, in the order they were recorded
    virtual std::vector<common::ImageReference> getNamedTaggedRepoTags() const = 0;
};

struct LookupResult {
    std::shared_ptr<const Image> image;
    std::string resolvedName;
};

class ImageStore {
public:
    virtual ~ImageStore() = default;
    // Throws libhoist::ImageNotFoundError if no image matches
    virtual LookupResult lookupImage(const std::string& name,
                                     const boost::optional<Platform>& platform = boost::none) const = 0;
};

}
}

#endif
