/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_common_Config_hpp
#define hoist_common_Config_hpp

#include <string>
#include <chrono>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace hoist {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& hoistInstallationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct Directories {
            void initialize(const common::Config& config);
            boost::filesystem::path repository;
        };

        boost::filesystem::path getRepositoryMetadataFile() const;
        boost::optional<boost::filesystem::path> getEventsFile() const;
        std::string getDefaultTransport() const;
        boost::filesystem::path getSkopeoPath() const;

        BuildTime buildTime;
        Directories directories;
        rapidjson::Document json{ rapidjson::kObjectType };

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement

        static const std::string DEFAULT_TRANSPORT;
};

}
}

#endif
