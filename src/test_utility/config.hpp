/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Throw-away configuration for the tests.
 */

#ifndef hoist_test_utility_config_hpp
#define hoist_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * Owns a temporary installation prefix with etc/hoist.json, a local repository,
 * a containers policy and a fake Skopeo executable. Everything is removed on destruction.
 *
 * The fake Skopeo appends its arguments to 'skopeoLog', prints a manifest
 * when inspecting and fails when any argument contains "fail". Inspecting
 * a reference that contains "unreadable" fails too.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(const ConfigRAII&) = delete;
    ConfigRAII(ConfigRAII&&) = default;
    ~ConfigRAII();
    std::shared_ptr<hoist::common::Config> config;
    boost::filesystem::path prefixDir;
    boost::filesystem::path skopeoLog;
    boost::filesystem::path imagesDir; // parent of the OCI layouts created by tests
};

ConfigRAII makeConfig();

extern const std::string fakeManifest;

}
}

#endif
