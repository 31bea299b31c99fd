/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_common_regex_hpp
#define hoist_common_regex_hpp

#include <string>

#include <boost/regex.hpp>

/**
 * Grammar of image references as accepted by container registries
 * (the Docker distribution reference format).
 */

namespace hoist {
namespace common {
namespace regex {

// [domain[:port]/]path-component[/path-component...]
extern const boost::regex name;
extern const boost::regex tag;
extern const boost::regex digest;
// anchored, captures: 1 = name, 2 = tag, 3 = digest
extern const boost::regex reference;

}
}
}

#endif
