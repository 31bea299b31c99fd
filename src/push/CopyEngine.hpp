/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_CopyEngine_hpp
#define hoist_push_CopyEngine_hpp

#include <string>

#include "transport/Reference.hpp"
#include "push/PushOptions.hpp"


namespace hoist {
namespace push {

/**
 * Transfers an image between two transport references.
 * Returns the raw manifest of the copied image, throws libhoist::CopyError on failure.
 *
 * The manifest is read back from the destination once the transfer is done. If that
 * read fails the copy is reported as failed, although the image may already be
 * published at the destination.
 */
class CopyEngine {
public:
    virtual ~CopyEngine() = default;
    virtual std::string copy(const transport::Reference& source,
                             const transport::Reference& destination,
                             const CopyOptions& options) const = 0;
};

}
}

#endif
