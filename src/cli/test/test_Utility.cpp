/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <tuple>

#include <boost/program_options.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "libhoist/test/aux/unitTestMain.hpp"

using namespace hoist;

TEST_GROUP(CLIUtilityTestGroup) {
};

static std::tuple<libhoist::CLIArguments, libhoist::CLIArguments> generateGroupedArguments(
        const libhoist::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {
    return cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
}

static boost::program_options::options_description makePushLikeOptions() {
    auto optionsDescription = boost::program_options::options_description();
    optionsDescription.add_options()
            ("all-tags,a", "All tags")
            ("format,f", boost::program_options::value<std::string>(), "Format")
            ("remove-signatures", "Remove signatures");
    return optionsDescription;
}

TEST(CLIUtilityTestGroup, groupOptionsAndPositionalArguments) {
    // no arguments
    {
        auto optionsDescription = boost::program_options::options_description();
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments({}, optionsDescription);
        CHECK(nameAndOptionArgs.empty());
        CHECK(positionalArgs.empty());
    }
    // name only
    {
        auto optionsDescription = boost::program_options::options_description();
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments({"hoist"}, optionsDescription);
        CHECK(positionalArgs.empty());
        CHECK_EQUAL(nameAndOptionArgs.argc(), 1);
        CHECK_EQUAL(nameAndOptionArgs[0], std::string{"hoist"});
    }
    // global options followed by a command
    {
        auto optionsDescription = boost::program_options::options_description();
        optionsDescription.add_options()
                ("debug", "Debug");
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"hoist", "--debug", "push", "--all-tags", "alpine"}, optionsDescription);

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"hoist", "--debug"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"push", "--all-tags", "alpine"}));
    }
    // long option with separated value
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "--format", "oci", "--remove-signatures", "alpine", "quay.io/ethcscs/alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "--format", "oci", "--remove-signatures"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine", "quay.io/ethcscs/alpine"}));
    }
    // long option with adjacent value
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "--format=oci", "alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "--format=oci"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine"}));
    }
    // short options without value
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "-a", "alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "-a"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine"}));
    }
    // grouped short options, the last one with separated value
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "-af", "v2s2", "alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "-af", "v2s2"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine"}));
    }
    // short option with adjacent value
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "-foci", "alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "-foci"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine"}));
    }
    // option with value not provided as last argument
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "--format"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "--format"}));
        CHECK(positionalArgs.empty());
    }
    // unknown options are kept for the parser to report
    {
        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
            {"push", "--unknown", "-x", "alpine"}, makePushLikeOptions());

        CHECK(nameAndOptionArgs == libhoist::CLIArguments({"push", "--unknown", "-x"}));
        CHECK(positionalArgs == libhoist::CLIArguments({"alpine"}));
    }
    // the first argument must be a name
    {
        CHECK_THROWS(libhoist::Error, generateGroupedArguments({"--debug", "push"}, makePushLikeOptions()));
    }
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    cli::utility::validateNumberOfPositionalArguments({"alpine"}, 1, 2, "push");
    cli::utility::validateNumberOfPositionalArguments({"alpine", "quay.io/ethcscs/alpine"}, 1, 2, "push");
    CHECK_THROWS(libhoist::Error, cli::utility::validateNumberOfPositionalArguments({}, 1, 2, "push"));
    CHECK_THROWS(libhoist::Error, cli::utility::validateNumberOfPositionalArguments({"a", "b", "c"}, 1, 2, "push"));
}

HOIST_UNITTEST_MAIN_FUNCTION();
