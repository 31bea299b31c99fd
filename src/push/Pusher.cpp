/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "push/Pusher.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "common/ImageReference.hpp"


namespace hoist {
namespace push {

Pusher::Pusher(std::shared_ptr<const image_store::ImageStore> imageStore,
               std::shared_ptr<const transport::TransportRegistry> transportRegistry,
               std::shared_ptr<const CopyEngine> copyEngine,
               std::shared_ptr<EventSink> eventSink,
               const std::string& defaultTransport)
    : imageStore{std::move(imageStore)}
    , copyEngine{std::move(copyEngine)}
    , eventSink{std::move(eventSink)}
    , destinationResolver{std::move(transportRegistry), defaultTransport}
{}

/**
 * Pushes the local image named by 'source'. An empty destination means the
 * location the source was found under, never the image ID.
 */
boost::optional<std::string> Pusher::push(const std::string& source,
                                          const std::string& destination,
                                          const PushOptions& options) const {
    // platform constraints are ignored: the named image is pushed as is
    auto lookup = imageStore->lookupImage(source);

    auto effectiveDestination = destination;
    if(effectiveDestination.empty()) {
        effectiveDestination = lookup.resolvedName;
    }

    printLog(boost::format("Pushing image %s (%s) to %s%s")
             % source % lookup.image->getID() % effectiveDestination % (options.allTags ? " with all tags" : ""),
             libhoist::LogLevel::INFO);

    if(options.allTags) {
        pushAllTags(*lookup.image, effectiveDestination, options);
        return boost::none;
    }
    return pushImage(*lookup.image, effectiveDestination, options);
}

std::string Pusher::pushImage(const image_store::Image& image,
                              const std::string& destination,
                              const PushOptions& options) const {
    auto sourceReference = image.getStorageReference();
    auto destinationReference = destinationResolver.resolve(destination);

    // checked after resolution so that the default transport applies
    if(options.allTags && destinationReference.transportName() != transport::REGISTRY_TRANSPORT) {
        auto message = boost::format("Cannot push %s: all-tags requires the %s transport, destination uses %s")
            % destination % transport::REGISTRY_TRANSPORT % destinationReference.transportName();
        HOIST_THROW_TYPED_ERROR(libhoist::UnsupportedModeError, message.str());
    }

    // from here on the attempt is recorded, whatever the outcome
    ScopedEventEmission event{eventSink, image.getID(), destination, EventType::ImagePush};

    auto copyOptions = makeCopyOptions(destinationReference, destination, options.copyOptions);

    printLog(boost::format("Copying %s to %s") % sourceReference % destinationReference, libhoist::LogLevel::DEBUG);
    return copyEngine->copy(sourceReference, destinationReference, copyOptions);
}

/**
 * Pushes every tag the image is known under to "<destinationBase>:<tag>".
 * Stops at the first failure.
 */
void Pusher::pushAllTags(const image_store::Image& image,
                         const std::string& destinationBase,
                         const PushOptions& options) const {
    auto repository = destinationBase;
    auto registryPrefix = transport::REGISTRY_TRANSPORT + "://";
    if(boost::starts_with(repository, registryPrefix)) {
        repository = repository.substr(registryPrefix.size());
    }

    if(repository.find(':') != std::string::npos) {
        auto message = boost::format("Cannot push %s: an explicit tag cannot be combined with all-tags") % destinationBase;
        HOIST_THROW_TYPED_ERROR(libhoist::ConflictingTagError, message.str());
    }

    auto tags = image.getNamedTaggedRepoTags();
    if(tags.empty()) {
        printLog(boost::format("Image %s has no tags: nothing pushed to %s") % image.getID() % destinationBase,
                 libhoist::LogLevel::WARN);
        return;
    }

    for(const auto& tag : tags) {
        auto destination = destinationBase + ":" + tag.tag;
        printLog(boost::format("Pushing tag %s to %s") % tag.tag % destination, libhoist::LogLevel::INFO);
        try {
            pushImage(image, destination, options);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to push tag %s of image %s") % tag.tag % image.getID();
            HOIST_RETHROW_ERROR(e, message.str());
        }
    }
}

/**
 * A docker-archive holds one image: the tag of the destination, if any, is recorded
 * inside the archive so that the image keeps its name.
 */
CopyOptions Pusher::makeCopyOptions(const transport::Reference& destinationReference,
                                    const std::string& destination,
                                    const CopyOptions& options) const {
    auto copyOptions = options;
    copyOptions.dockerArchiveAdditionalTags.clear();

    if(destinationReference.transportName() != transport::ARCHIVE_TRANSPORT) {
        return copyOptions;
    }

    auto named = common::parseNamedReference(destination);
    if(named && !named->tag.empty()) {
        printLog(boost::format("Recording tag %s in archive %s") % named->tag % destinationReference,
                 libhoist::LogLevel::DEBUG);
        copyOptions.dockerArchiveAdditionalTags = { *named };
    }
    return copyOptions;
}

void Pusher::printLog(const boost::format& message, libhoist::LogLevel logLevel,
                      std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), logLevel, outStream, errStream);
}

void Pusher::printLog(const std::string& message, libhoist::LogLevel logLevel,
                      std::ostream& outStream, std::ostream& errStream) const {
    libhoist::Logger::getInstance().log(message, sysname, logLevel, outStream, errStream);
}

}
}
