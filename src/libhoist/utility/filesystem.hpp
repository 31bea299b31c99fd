/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_filesystem_hpp
#define libhoist_utility_filesystem_hpp

#include <string>
#include <ios>

#include <boost/filesystem.hpp>

namespace libhoist {
namespace filesystem {

// Tolerates directories created concurrently by another process
void createFoldersIfNecessary(const boost::filesystem::path&);
std::string readFile(const boost::filesystem::path& path);
void writeTextFile(const std::string& text,
                   const boost::filesystem::path& filename,
                   const std::ios_base::openmode mode = std::ios_base::out);
// "<path>-<random suffix>" that doesn't exist yet
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
bool isExecutableFile(const boost::filesystem::path&);

}}

#endif
