/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <cstdlib>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/Utility.hpp"
#include "common/ImageReference.hpp"
#include "test_utility/config.hpp"
#include "push/SkopeoDriver.hpp"
#include "libhoist/test/aux/unitTestMain.hpp"

namespace hoist {
namespace push {
namespace test {

namespace {

const transport::Reference source{"oci", "/var/lib/hoist/images/a1b2"};

std::vector<std::string> readSkopeoLog(const boost::filesystem::path& log) {
    auto content = libhoist::filesystem::readFile(log);
    boost::trim_right_if(content, boost::is_any_of("\n"));
    auto lines = std::vector<std::string>{};
    boost::split(lines, content, boost::is_any_of("\n"));
    return lines;
}

}

TEST_GROUP(SkopeoDriverTestGroup) {
    void setup() {
        libhoist::Logger::getInstance().setLevel(libhoist::LogLevel::WARN);
    }
};

TEST(SkopeoDriverTestGroup, invalidSkopeoPath) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json["skopeoPath"].SetString("/hoist/nonexistent/skopeo", json.GetAllocator());
    CHECK_THROWS(libhoist::Error, SkopeoDriver{configRAII.config});

    // not executable
    json["skopeoPath"].SetString(configRAII.skopeoLog.c_str(), json.GetAllocator());
    libhoist::filesystem::writeTextFile("", configRAII.skopeoLog);
    CHECK_THROWS(libhoist::Error, SkopeoDriver{configRAII.config});
}

TEST(SkopeoDriverTestGroup, invalidPolicyPath) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json["containersPolicy"]["path"].SetString("/hoist/nonexistent/policy.json", json.GetAllocator());
    CHECK_THROWS(libhoist::Error, SkopeoDriver{configRAII.config});
}

TEST(SkopeoDriverTestGroup, enforcedPolicy) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};

    auto expected = libhoist::CLIArguments{configRAII.config->getSkopeoPath().string(),
                                           "--policy", (configRAII.prefixDir / "etc/policy.json").string()};
    CHECK(driver.generateBaseArgs() == expected);
}

TEST(SkopeoDriverTestGroup, userPolicy) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json["containersPolicy"]["enforce"].SetBool(false);

    auto home = configRAII.prefixDir / "home";
    libhoist::filesystem::writeTextFile(R"({"default":[{"type":"reject"}]})", home / ".config/containers/policy.json");
    auto previousHome = libhoist::environment::getVariable("HOME");
    setenv("HOME", home.c_str(), 1);

    auto driver = SkopeoDriver{configRAII.config};
    auto args = driver.generateBaseArgs();

    if(previousHome) {
        setenv("HOME", previousHome->c_str(), 1);
    }
    else {
        unsetenv("HOME");
    }

    CHECK(args == libhoist::CLIArguments{configRAII.config->getSkopeoPath().string()});
}

TEST(SkopeoDriverTestGroup, debugVerbosity) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};

    libhoist::Logger::getInstance().setLevel(libhoist::LogLevel::DEBUG);
    auto args = driver.generateBaseArgs();
    libhoist::Logger::getInstance().setLevel(libhoist::LogLevel::WARN);

    CHECK_EQUAL(args.argc(), 4);
    CHECK_EQUAL(args[1], std::string{"--debug"});
}

TEST(SkopeoDriverTestGroup, copyArgs) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};
    auto destination = transport::Reference{"docker-archive", "/tmp/alpine.tar"};

    auto options = CopyOptions{};
    options.manifestType = std::string{"v2s2"};
    options.removeSignatures = true;
    options.compressionFormat = std::string{"gzip"};
    options.dockerArchiveAdditionalTags = { common::parseImageReference("alpine:3.18") };

    auto expected = driver.generateBaseArgs() + libhoist::CLIArguments{
        "copy",
        "--format", "v2s2",
        "--remove-signatures",
        "--dest-compress-format", "gzip",
        "--additional-tag", "index.docker.io/library/alpine:3.18",
        "oci:/var/lib/hoist/images/a1b2",
        "docker-archive:/tmp/alpine.tar"};
    CHECK(driver.generateCopyArgs(source, destination, options) == expected);

    // no options
    expected = driver.generateBaseArgs() + libhoist::CLIArguments{
        "copy", "oci:/var/lib/hoist/images/a1b2", "docker-archive:/tmp/alpine.tar"};
    CHECK(driver.generateCopyArgs(source, destination, CopyOptions{}) == expected);
}

TEST(SkopeoDriverTestGroup, copy) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};
    auto destination = transport::Reference{"docker", "//quay.io/ethcscs/alpine:3.18"};
    auto options = CopyOptions{};
    options.removeSignatures = true;

    auto manifest = driver.copy(source, destination, options);
    CHECK_EQUAL(manifest, test_utility::config::fakeManifest);

    auto policy = (configRAII.prefixDir / "etc/policy.json").string();
    auto log = readSkopeoLog(configRAII.skopeoLog);
    CHECK_EQUAL(log.size(), 2);
    CHECK_EQUAL(log[0], "--policy " + policy + " copy --remove-signatures "
                        "oci:/var/lib/hoist/images/a1b2 docker://quay.io/ethcscs/alpine:3.18");
    CHECK_EQUAL(log[1], "--policy " + policy + " inspect --raw docker://quay.io/ethcscs/alpine:3.18");
}

TEST(SkopeoDriverTestGroup, failedCopy) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};
    auto destination = transport::Reference{"docker", "//quay.io/fail/alpine:3.18"};

    CHECK_THROWS(libhoist::CopyError, driver.copy(source, destination, CopyOptions{}));

    // not inspected after the failure
    CHECK_EQUAL(readSkopeoLog(configRAII.skopeoLog).size(), 1);
}

TEST(SkopeoDriverTestGroup, unreadableManifestAfterCopy) {
    auto configRAII = test_utility::config::makeConfig();
    auto driver = SkopeoDriver{configRAII.config};
    auto destination = transport::Reference{"docker", "//quay.io/unreadable/alpine:3.18"};

    try {
        driver.copy(source, destination, CopyOptions{});
        FAIL("expected exception was not thrown");
    }
    catch(const libhoist::CopyError& e) {
        CHECK(std::string{e.what()}.find("Failed to inspect") != std::string::npos);
        CHECK(e.getErrorTrace().back().errorMessage.find("after copy") != std::string::npos);
    }

    // the copy itself went through
    auto log = readSkopeoLog(configRAII.skopeoLog);
    CHECK_EQUAL(log.size(), 2);
    CHECK(log[0].find(" copy ") != std::string::npos);
    CHECK(log[1].find(" inspect --raw ") != std::string::npos);
}

}}}

HOIST_UNITTEST_MAIN_FUNCTION();
