/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <cstdlib>

#include <boost/filesystem.hpp>

#include "aux/unitTestMain.hpp"
#include "libhoist/Error.hpp"
#include "libhoist/Utility.hpp"


namespace libhoist {
namespace test {

TEST_GROUP(UtilityTestGroup) {
    boost::filesystem::path testDir = libhoist::filesystem::makeUniquePathWithRandomSuffix("/tmp/hoist-test-utility");

    void setup() {
        libhoist::filesystem::createFoldersIfNecessary(testDir);
    }

    void teardown() {
        boost::filesystem::remove_all(testDir);
    }
};

TEST(UtilityTestGroup, forkExecWait) {
    CHECK_EQUAL(libhoist::process::forkExecWait(libhoist::CLIArguments{"true"}), 0);
    CHECK(libhoist::process::forkExecWait(libhoist::CLIArguments{"false"}) != 0);
}

TEST(UtilityTestGroup, forkExecWaitCapturesStdout) {
    std::stringstream output;
    auto status = libhoist::process::forkExecWait(libhoist::CLIArguments{"echo", "manifest"}, &output);
    CHECK_EQUAL(status, 0);
    CHECK_EQUAL(output.str(), std::string{"manifest\n"});
}

TEST(UtilityTestGroup, forkExecWaitOfMissingProgram) {
    auto missing = testDir / "missing-program";
    CHECK_EQUAL(libhoist::process::forkExecWait(libhoist::CLIArguments{missing.string()}), 127);
    CHECK_THROWS(libhoist::Error, libhoist::process::forkExecWait(libhoist::CLIArguments{}));
}

TEST(UtilityTestGroup, forkExecWaitReportsExitStatus) {
    CHECK_EQUAL(libhoist::process::forkExecWait(libhoist::CLIArguments{"sh", "-c", "exit 3"}), 3);
}

TEST(UtilityTestGroup, createFoldersIfNecessary) {
    auto nested = testDir / "a/b/c";
    libhoist::filesystem::createFoldersIfNecessary(nested);
    CHECK(boost::filesystem::is_directory(nested));
    // idempotent
    libhoist::filesystem::createFoldersIfNecessary(nested);
}

TEST(UtilityTestGroup, writeAndReadTextFile) {
    auto file = testDir / "dir/file.txt";
    libhoist::filesystem::writeTextFile("line1\n", file);
    libhoist::filesystem::writeTextFile("line2\n", file, std::ios_base::app);
    CHECK_EQUAL(libhoist::filesystem::readFile(file), std::string{"line1\nline2\n"});

    CHECK_THROWS(libhoist::Error, libhoist::filesystem::readFile(testDir / "missing.txt"));
}

TEST(UtilityTestGroup, makeUniquePathWithRandomSuffix) {
    auto first = libhoist::filesystem::makeUniquePathWithRandomSuffix(testDir / "file");
    auto second = libhoist::filesystem::makeUniquePathWithRandomSuffix(testDir / "file");
    CHECK(first != second);
    CHECK(first.parent_path() == testDir);
}

TEST(UtilityTestGroup, isExecutableFile) {
    auto script = testDir / "script.sh";
    libhoist::filesystem::writeTextFile("#!/bin/sh\n", script);
    CHECK(!libhoist::filesystem::isExecutableFile(script));
    boost::filesystem::permissions(script, boost::filesystem::perms::owner_all);
    CHECK(libhoist::filesystem::isExecutableFile(script));
    CHECK(!libhoist::filesystem::isExecutableFile(testDir));
}

TEST(UtilityTestGroup, isHexadecimal) {
    CHECK(libhoist::string::isHexadecimal("0123456789abcdef"));
    CHECK(!libhoist::string::isHexadecimal(""));
    CHECK(!libhoist::string::isHexadecimal("ABCDEF"));
    CHECK(!libhoist::string::isHexadecimal("sha256:abcd"));
    CHECK(!libhoist::string::isHexadecimal("alpine"));
}

TEST(UtilityTestGroup, generateRandom) {
    auto random = libhoist::string::generateRandom(16);
    CHECK_EQUAL(random.size(), 16);
    CHECK(random.find_first_not_of("abcdefghijklmnopqrstuvwxyz") == std::string::npos);
}

TEST(UtilityTestGroup, environmentVariables) {
    setenv("HOIST_TEST_VARIABLE", "value", 1);
    CHECK(*libhoist::environment::getVariable("HOIST_TEST_VARIABLE") == "value");

    unsetenv("HOIST_TEST_VARIABLE");
    CHECK(!libhoist::environment::getVariable("HOIST_TEST_VARIABLE"));
}

TEST(UtilityTestGroup, jsonWriteAndRead) {
    auto file = testDir / "document.json";
    auto document = libhoist::json::parse(R"({"images": [{"id": "abc", "names": ["alpine:3.18"]}]})");
    libhoist::json::write(document, file);

    auto read = libhoist::json::read(file);
    CHECK(read == document);
    CHECK_EQUAL(libhoist::json::serialize(read["images"][0]["names"]),
                std::string{R"(["alpine:3.18"])"});

    // replaced atomically
    CHECK(!boost::filesystem::exists(file.string() + ".tmp"));

    CHECK_THROWS(libhoist::Error, libhoist::json::parse("{not json"));
    CHECK_THROWS(libhoist::Error, libhoist::json::read(testDir / "missing.json"));
}

TEST(UtilityTestGroup, jsonReadAndValidate) {
    auto schemaFile = testDir / "schema.json";
    libhoist::filesystem::writeTextFile(R"({
        "type": "object",
        "properties": { "repositoryDir": { "type": "string", "pattern": "^/" } },
        "required": ["repositoryDir"],
        "additionalProperties": false
    })", schemaFile);

    auto validFile = testDir / "valid.json";
    libhoist::filesystem::writeTextFile(R"({"repositoryDir": "/var/hoist"})", validFile);
    auto json = libhoist::json::readAndValidate(validFile, schemaFile);
    CHECK_EQUAL(std::string{json["repositoryDir"].GetString()}, std::string{"/var/hoist"});

    auto relativePathFile = testDir / "relative.json";
    libhoist::filesystem::writeTextFile(R"({"repositoryDir": "var/hoist"})", relativePathFile);
    CHECK_THROWS(libhoist::Error, libhoist::json::readAndValidate(relativePathFile, schemaFile));

    auto unknownKeyFile = testDir / "unknown.json";
    libhoist::filesystem::writeTextFile(R"({"repositoryDir": "/var/hoist", "unknown": 1})", unknownKeyFile);
    CHECK_THROWS(libhoist::Error, libhoist::json::readAndValidate(unknownKeyFile, schemaFile));
}

}}

HOIST_UNITTEST_MAIN_FUNCTION();
