/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "push/SkopeoDriver.hpp"

#include <chrono>
#include <sstream>

#include <rapidjson/pointer.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/Utility.hpp"


namespace hoist {
namespace push {

SkopeoDriver::SkopeoDriver(std::shared_ptr<const common::Config> config)
    : skopeoPath{config->getSkopeoPath()}
{
    if (!libhoist::filesystem::isExecutableFile(skopeoPath)) {
        auto message = boost::format("The path to the Skopeo executable '%s' configured in hoist.json does not "
                                     "lead to an executable file. "
                                     "Please contact your system administrator.") % skopeoPath;
        HOIST_THROW_ERROR(message.str());
    }

    if (const rapidjson::Value* configPolicy = rapidjson::Pointer("/containersPolicy/path").Get(config->json)) {
        if (!boost::filesystem::is_regular_file(configPolicy->GetString())) {
            auto message = boost::format("Custom containers policy file '%s' configured in hoist.json is not a regular file. "
                                         "Please contact your system administrator.") % configPolicy->GetString();
            HOIST_THROW_ERROR(message.str());
        }
        customPolicyPath = boost::filesystem::path(configPolicy->GetString());
    }

    if (const rapidjson::Value* configEnforcePolicy = rapidjson::Pointer("/containersPolicy/enforce").Get(config->json)) {
        enforceCustomPolicy = configEnforcePolicy->GetBool();
    }
    else {
        enforceCustomPolicy = false;
    }
}

/**
 * Copies the image and returns the raw manifest found at the destination afterwards.
 */
std::string SkopeoDriver::copy(const transport::Reference& source,
                               const transport::Reference& destination,
                               const CopyOptions& options) const {
    printLog(boost::format("Copying %s to %s") % source % destination, libhoist::LogLevel::INFO);

    auto args = libhoist::CLIArguments{};
    try {
        args = generateCopyArgs(source, destination, options);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to prepare copy of %s to %s: %s") % source % destination % e.what();
        HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
    }

    auto start = std::chrono::system_clock::now();
    auto status = int{};
    try {
        status = libhoist::process::forkExecWait(args);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to copy %s to %s: %s") % source % destination % e.what();
        HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
    }
    if(status != 0) {
        auto message = boost::format("Failed to copy %s to %s: Skopeo terminated with status %d")
            % source % destination % status;
        HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
    }
    auto end = std::chrono::system_clock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / double(1000);
    printLog(boost::format("Elapsed time on copy operation: %s [sec]") % elapsed, libhoist::LogLevel::INFO);

    auto manifest = std::string{};
    try {
        manifest = inspectRaw(destination);
    }
    catch(const std::exception& e) {
        printLog(boost::format("Image was copied to %s but its manifest could not be read back") % destination,
                 libhoist::LogLevel::WARN);
        auto message = boost::format("Failed to read manifest of %s after copy") % destination;
        HOIST_RETHROW_ERROR(e, message.str());
    }
    printLog(boost::format("Successfully copied %s to %s") % source % destination, libhoist::LogLevel::INFO);
    return manifest;
}

std::string SkopeoDriver::inspectRaw(const transport::Reference& reference) const {
    auto args = libhoist::CLIArguments{};
    auto output = std::stringstream{};
    auto status = int{};

    try {
        args = generateBaseArgs() + libhoist::CLIArguments{"inspect", "--raw", reference.string()};
        status = libhoist::process::forkExecWait(args, &output);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to inspect %s: %s") % reference % e.what();
        HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
    }
    if(status != 0) {
        auto message = boost::format("Failed to inspect %s: Skopeo terminated with status %d") % reference % status;
        HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
    }

    // Skopeo debug messages may precede the manifest: only keep the JSON output
    auto inspectOutput = output.str();
    inspectOutput = inspectOutput.substr(inspectOutput.rfind("\n{")+1);
    boost::algorithm::trim_right_if(inspectOutput, boost::is_any_of("\n"));

    printLog(boost::format("Raw inspect filtered output: %s") % inspectOutput, libhoist::LogLevel::DEBUG);
    return inspectOutput;
}

libhoist::CLIArguments SkopeoDriver::generateBaseArgs() const {
    auto args = libhoist::CLIArguments{skopeoPath.string()};

    auto verbosity = getVerbosityOption();
    if (!verbosity.empty()) {
        args.push_back(verbosity);
    }

    args += getPolicyOption();

    return args;
}

libhoist::CLIArguments SkopeoDriver::generateCopyArgs(const transport::Reference& source,
                                                      const transport::Reference& destination,
                                                      const CopyOptions& options) const {
    auto args = generateBaseArgs();
    args.push_back("copy");

    if (options.manifestType) {
        args += libhoist::CLIArguments{"--format", *options.manifestType};
    }
    if (options.removeSignatures) {
        args.push_back("--remove-signatures");
    }
    if (options.compressionFormat) {
        args += libhoist::CLIArguments{"--dest-compress-format", *options.compressionFormat};
    }
    for (const auto& tag : options.dockerArchiveAdditionalTags) {
        args += libhoist::CLIArguments{"--additional-tag", tag.string()};
    }

    args += libhoist::CLIArguments{source.string(), destination.string()};
    return args;
}

std::string SkopeoDriver::getVerbosityOption() const {
    auto logLevel = libhoist::Logger::getInstance().getLevel();
    if (logLevel == libhoist::LogLevel::DEBUG) {
        return std::string{"--debug"};
    }
    return std::string{};
}

libhoist::CLIArguments SkopeoDriver::getPolicyOption() const {
    if (enforceCustomPolicy) {
        return libhoist::CLIArguments{"--policy", customPolicyPath.string()};
    }

    auto systemPolicyPath = boost::filesystem::path("/etc/containers/policy.json");
    auto home = libhoist::environment::getVariable("HOME");
    auto hasUserPolicy = home && boost::filesystem::exists(boost::filesystem::path{*home} / ".config/containers/policy.json");

    if (hasUserPolicy || boost::filesystem::exists(systemPolicyPath)) {
        return libhoist::CLIArguments{};
    }
    else if (!customPolicyPath.empty()) {
        return libhoist::CLIArguments{"--policy", customPolicyPath.string()};
    }
    else {
        HOIST_THROW_ERROR("Failed to detect default containers policy files and "
                          "no fallback policy file defined in hoist.json. "
                          "Please contact your system administrator.");
    }
}

void SkopeoDriver::printLog(const boost::format &message, libhoist::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), level, outStream, errStream);
}

void SkopeoDriver::printLog(const std::string& message, libhoist::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    libhoist::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}} // namespace
