/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_PushOptions_hpp
#define hoist_push_PushOptions_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "common/ImageReference.hpp"


namespace hoist {
namespace push {

/**
 * Settings forwarded to the copy engine for a single copy.
 */
struct CopyOptions {
    boost::optional<std::string> manifestType;       // e.g. "oci" or "v2s2"
    bool removeSignatures = false;
    boost::optional<std::string> compressionFormat;  // e.g. "gzip" or "zstd"
    // names recorded inside a docker-archive destination
    std::vector<common::ImageReference> dockerArchiveAdditionalTags;
};

struct PushOptions {
    CopyOptions copyOptions;
    bool allTags = false;
};

}
}

#endif
