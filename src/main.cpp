/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <memory>
#include <chrono>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/CLIArguments.hpp"
#include "cli/CLI.hpp"

using namespace hoist;

// <prefix>/bin/hoist reads <prefix>/etc/hoist.json
static boost::filesystem::path getInstallationPrefix() {
    return boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
}

static int run(int argc, char* argv[]) {
    auto start = std::chrono::high_resolution_clock::now();

    auto config = std::make_shared<common::Config>(getInstallationPrefix());
    config->program_start = start;

    auto command = cli::CLI{}.parseCommandLine(libhoist::CLIArguments(argc, argv), config);
    command->execute();
    return 0;
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8");
    umask(022);

    auto& logger = libhoist::Logger::getInstance();

    try {
        return run(argc, argv);
    }
    catch(const libhoist::Error& e) {
        logger.logErrorTrace(e, "main");
    }
    catch(const std::exception& e) {
        auto message = boost::format("Unexpected %s without error trace: %s")
            % libhoist::getExceptionTypeString(e) % e.what();
        logger.log(message, "main", libhoist::LogLevel::ERROR);
    }
    return 1;
}
