/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libhoist/Utility.hpp"

namespace rj = rapidjson;
using namespace hoist;

namespace test_utility {
namespace config {

const std::string fakeManifest = R"({"schemaVersion":2,"mediaType":"application/vnd.oci.image.manifest.v1+json"})";

ConfigRAII::~ConfigRAII() {
    if(!prefixDir.empty()) {
        boost::filesystem::remove_all(prefixDir);
    }
}

static void createFakeSkopeo(const boost::filesystem::path& skopeo, const boost::filesystem::path& log) {
    auto script = boost::format{
        "#!/bin/sh\n"
        "echo \"$@\" >> %s\n"
        "inspect=0\n"
        "for arg in \"$@\"; do\n"
        "    case \"$arg\" in\n"
        "        *fail*) exit 1 ;;\n"
        "        inspect) inspect=1 ;;\n"
        "    esac\n"
        "done\n"
        "if [ $inspect = 1 ]; then\n"
        "    for arg in \"$@\"; do\n"
        "        case \"$arg\" in\n"
        "            *unreadable*) exit 1 ;;\n"
        "        esac\n"
        "    done\n"
        "    echo 'time=\"2023-01-01T00:00:00Z\" level=debug msg=\"inspecting\"'\n"
        "    echo '%s'\n"
        "fi\n"
        "exit 0\n"} % log.string() % fakeManifest;
    libhoist::filesystem::writeTextFile(script.str(), skopeo);
    boost::filesystem::permissions(skopeo, boost::filesystem::perms::owner_all);
}

static void populateJSON(rj::Document& document, const boost::filesystem::path& prefixDir) {
    auto& allocator = document.GetAllocator();

    auto repositoryDir = prefixDir / "repository";
    auto skopeoPath = prefixDir / "bin/skopeo";
    auto policyPath = prefixDir / "etc/policy.json";
    auto eventsFile = prefixDir / "var/events.jsonl";

    document.AddMember( "repositoryDir",
                        rj::Value{repositoryDir.c_str(), allocator},
                        allocator);
    document.AddMember( "skopeoPath",
                        rj::Value{skopeoPath.c_str(), allocator},
                        allocator);
    document.AddMember( "defaultTransport",
                        rj::Value{"docker://", allocator},
                        allocator);
    document.AddMember( "eventsFile",
                        rj::Value{eventsFile.c_str(), allocator},
                        allocator);

    rj::Value policyValue(rj::kObjectType);
    policyValue.AddMember("path", rj::Value{policyPath.c_str(), allocator}, allocator);
    policyValue.AddMember("enforce", true, allocator);
    document.AddMember("containersPolicy", policyValue, allocator);
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = libhoist::filesystem::makeUniquePathWithRandomSuffix(boost::filesystem::absolute("hoist-test-prefix-dir"));
    raii.skopeoLog = raii.prefixDir / "skopeo.log";
    raii.imagesDir = raii.prefixDir / "repository/images";

    auto json = rj::Document{rj::kObjectType};
    populateJSON(json, raii.prefixDir);

    // installation prefix
    libhoist::filesystem::createFoldersIfNecessary(raii.prefixDir / "etc");
    libhoist::json::write(json, raii.prefixDir / "etc/hoist.json");
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    boost::filesystem::copy_file(repoRootDir / "etc/hoist.schema.json", raii.prefixDir / "etc/hoist.schema.json");
    libhoist::filesystem::writeTextFile(R"({"default":[{"type":"insecureAcceptAnything"}]})",
                                        raii.prefixDir / "etc/policy.json");
    createFakeSkopeo(raii.prefixDir / "bin/skopeo", raii.skopeoLog);

    raii.config = std::make_shared<common::Config>(raii.prefixDir);
    raii.config->directories.initialize(*raii.config);

    return raii;
}

}
}
