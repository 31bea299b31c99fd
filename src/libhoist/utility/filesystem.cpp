/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/utility/logging.hpp"
#include "libhoist/utility/string.hpp"

namespace libhoist {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    if(path.empty() || boost::filesystem::is_directory(path)) {
        return;
    }

    logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);

    boost::system::error_code ec;
    boost::filesystem::create_directories(path, ec);
    // a concurrent creation makes create_directories fail although the directory is there
    if(ec && !boost::filesystem::is_directory(path)) {
        auto message = boost::format("Failed to create directory %s: %s") % path % ec.message();
        HOIST_THROW_ERROR(message.str());
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string());
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        HOIST_THROW_ERROR(message.str());
    }
    std::ostringstream content;
    content << ifs.rdbuf();
    return content.str();
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    createFoldersIfNecessary(filename.parent_path());

    std::ofstream ofs(filename.string(), mode);
    if(!ofs) {
        auto message = boost::format("Failed to open %s for writing") % filename;
        HOIST_THROW_ERROR(message.str());
    }
    if(!(ofs << text).flush()) {
        auto message = boost::format("Failed to write text file %s") % filename;
        HOIST_THROW_ERROR(message.str());
    }
}

// boost::filesystem::unique_path throws when the locale configuration is invalid
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    const size_t suffixSize = 16;
    auto candidate = boost::filesystem::path{};
    do {
        candidate = path.string() + "-" + string::generateRandom(suffixSize);
    } while(boost::filesystem::exists(candidate));
    return candidate;
}

bool isExecutableFile(const boost::filesystem::path& path) {
    return boost::filesystem::is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

}}
