/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_environment_hpp
#define libhoist_utility_environment_hpp

#include <string>

#include <boost/optional.hpp>

namespace libhoist {
namespace environment {

// boost::none if the variable is not set
boost::optional<std::string> getVariable(const std::string& key);

}}

#endif
