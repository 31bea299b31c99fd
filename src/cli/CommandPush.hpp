/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_cli_CommandPush_hpp
#define hoist_cli_CommandPush_hpp

#include <iostream>
#include <string>
#include <memory>
#include <tuple>
#include <chrono>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"
#include "image_store/LocalImageStore.hpp"
#include "transport/TransportRegistry.hpp"
#include "push/PushOptions.hpp"
#include "push/SkopeoDriver.hpp"
#include "push/EventLog.hpp"
#include "push/Pusher.hpp"


namespace hoist {
namespace cli {

class CommandPush : public Command {
public:
    CommandPush() {
        initializeOptionsDescription();
    }

    CommandPush(const libhoist::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto eventSink = std::shared_ptr<push::EventSink>{};
        if(auto eventsFile = conf->getEventsFile()) {
            eventSink = std::make_shared<push::EventLog>(*eventsFile);
        }

        auto pusher = push::Pusher{
            std::make_shared<image_store::LocalImageStore>(conf),
            std::make_shared<transport::BuiltinTransportRegistry>(),
            std::make_shared<push::SkopeoDriver>(conf),
            eventSink,
            conf->getDefaultTransport()};

        auto manifest = pusher.push(source, destination, options);
        if(manifest) {
            libhoist::Logger::getInstance().log(*manifest, "CommandPush", libhoist::LogLevel::GENERAL);
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - conf->program_start);
        cli::utility::printLog(boost::format("push of %s completed in %d ms") % source % elapsed.count(),
                               libhoist::LogLevel::INFO);
    }

    std::string getBriefDescription() const override {
        return "Push an image from the local repository to a destination";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("hoist push [OPTIONS] SOURCE [DESTINATION]")
            .setDescription(getBriefDescription() + "\n\n"
                            "DESTINATION is a transport-qualified reference (e.g. docker://quay.io/user/image:tag,\n"
                            "docker-archive:/path/image.tar, oci:/path/layout). Without a transport, the\n"
                            "configured default transport is used. Without DESTINATION, the image is pushed\n"
                            "to the name it was found under.")
            .setOptionsDescription(optionsDescription)
            .addExample("hoist push alpine:3.18",
                        "push to the registry the image was pulled from")
            .addExample("hoist push alpine:3.18 quay.io/user/alpine:3.18",
                        "push to another registry with the default transport")
            .addExample("hoist push --all-tags alpine docker://quay.io/user/alpine",
                        "push every local tag of the repository")
            .addExample("hoist push alpine:3.18 docker-archive:/tmp/alpine.tar",
                        "save to an archive, keeping the tag alpine:3.18");
        std::cout << printer;
    }

    // for test purpose
    const push::PushOptions& getPushOptions() const { return options; }
    const std::string& getSource() const { return source; }
    const std::string& getDestination() const { return destination; }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("all-tags,a", "Push all the tags of the image (requires a registry destination without tag)")
            ("format,f",
                boost::program_options::value<std::string>(),
                "Manifest type to use at the destination (oci, v2s1 or v2s2)")
            ("remove-signatures", "Do not copy signatures of the source image")
            ("compression-format",
                boost::program_options::value<std::string>(),
                "Compression format of the layers at the destination (e.g. gzip, zstd)");
    }

    void parseCommandArguments(const libhoist::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of push command: %s") % args, libhoist::LogLevel::DEBUG);

        libhoist::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the push command expects the source and optionally the destination
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 2, "push");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            options.allTags = values.count("all-tags");
            options.copyOptions.removeSignatures = values.count("remove-signatures");
            if(values.count("format")) {
                options.copyOptions.manifestType = values["format"].as<std::string>();
            }
            if(values.count("compression-format")) {
                options.copyOptions.compressionFormat = values["compression-format"].as<std::string>();
            }

            source = positionalArgs[0];
            if(positionalArgs.argc() > 1) {
                destination = positionalArgs[1];
            }
        }
        catch(const boost::program_options::error& e) {
            cli::utility::throwUsageError(e.what(), "push");
        }

        conf->directories.initialize(*conf);

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libhoist::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    push::PushOptions options;
    std::string source;
    std::string destination;
};

}
}

#endif
