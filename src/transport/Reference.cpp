/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/Reference.hpp"


namespace hoist {
namespace transport {

Reference::Reference(const std::string& transportName, const std::string& location)
    : transport{transportName}
    , location{location}
{}

std::string Reference::string() const {
    return transport + ":" + location;
}

bool operator==(const Reference& lhs, const Reference& rhs) {
    return lhs.transportName() == rhs.transportName()
        && lhs.getLocation() == rhs.getLocation();
}

bool operator!=(const Reference& lhs, const Reference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Reference& reference) {
    os << reference.string();
    return os;
}

}
}
