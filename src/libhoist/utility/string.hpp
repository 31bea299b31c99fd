/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_string_hpp
#define libhoist_utility_string_hpp

#include <string>
#include <cstddef>

namespace libhoist {
namespace string {

// Lower-case letters only
std::string generateRandom(size_t size);
// Lower-case hexadecimal digits only, as in image IDs and digests
bool isHexadecimal(const std::string&);

}}

#endif
