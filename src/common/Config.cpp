/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Utility.hpp"


namespace hoist {
namespace common {

const std::string Config::DEFAULT_TRANSPORT{"docker://"};

Config::BuildTime::BuildTime()
    : version{HOIST_VERSION}
{}

Config::Config(const boost::filesystem::path& hoistInstallationPrefixDir)
    : Config{hoistInstallationPrefixDir / "etc/hoist.json", hoistInstallationPrefixDir / "etc/hoist.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libhoist::json::readAndValidate(configFilename, configSchemaFilename) }
{}

void Config::Directories::initialize(const common::Config& config) {
    libhoist::logMessage("initializing config's directories for local repository", libhoist::LogLevel::DEBUG);
    repository = boost::filesystem::path{ config.json["repositoryDir"].GetString() };
}

boost::filesystem::path Config::getRepositoryMetadataFile() const {
    return directories.repository / "metadata.json";
}

boost::optional<boost::filesystem::path> Config::getEventsFile() const {
    if(!json.HasMember("eventsFile")) {
        return boost::none;
    }
    return boost::filesystem::path{ json["eventsFile"].GetString() };
}

/**
 * The transport prefix tried when a destination has no recognized transport.
 * Defaults to the registry transport.
 */
std::string Config::getDefaultTransport() const {
    if(!json.HasMember("defaultTransport")) {
        return DEFAULT_TRANSPORT;
    }
    return json["defaultTransport"].GetString();
}

boost::filesystem::path Config::getSkopeoPath() const {
    return boost::filesystem::path{ json["skopeoPath"].GetString() };
}

}} // namespaces
