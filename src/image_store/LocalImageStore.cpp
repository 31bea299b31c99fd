/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image_store/LocalImageStore.hpp"

#include <algorithm>
#include <memory>

#include <boost/algorithm/string.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"
#include "libhoist/Lockfile.hpp"
#include "libhoist/Utility.hpp"


namespace rj = rapidjson;

namespace hoist {
namespace image_store {

LocalImage::LocalImage(const std::string& id,
                       const std::vector<common::ImageReference>& names,
                       const boost::filesystem::path& layout,
                       const Platform& platform)
    : id{id}
    , names{names}
    , layout{layout}
    , platform{platform}
{}

transport::Reference LocalImage::getStorageReference() const {
    if(!boost::filesystem::is_directory(layout)) {
        auto message = boost::format("Storage of image %s not found: OCI layout %s is not a directory") % id % layout;
        HOIST_THROW_ERROR(message.str());
    }
    return transport::Reference{transport::OCI_LAYOUT_TRANSPORT, layout.string()};
}

std::vector<common::ImageReference> LocalImage::getNamedTaggedRepoTags() const {
    auto tagged = std::vector<common::ImageReference>{};
    std::copy_if(names.cbegin(), names.cend(), std::back_inserter(tagged),
                 [](const common::ImageReference& name) { return !name.tag.empty(); });
    return tagged;
}

bool isMatchingPlatform(const Platform& image, const Platform& requested) {
    if(!requested.os.empty() && image.os != requested.os) {
        return false;
    }
    if(!requested.architecture.empty() && image.architecture != requested.architecture) {
        return false;
    }
    if(!requested.variant.empty() && image.variant != requested.variant) {
        return false;
    }
    return true;
}

LocalImageStore::LocalImageStore(std::shared_ptr<const common::Config> config)
    : metadataFile{config->getRepositoryMetadataFile()}
{}

/**
 * Look up an image by ID, unique ID prefix or name. Platform constraints, when given,
 * restrict the candidate images before the lookup.
 */
LookupResult LocalImageStore::lookupImage(const std::string& name, const boost::optional<Platform>& platform) const {
    printLog(boost::format("Looking up image '%s' in local repository") % name, libhoist::LogLevel::DEBUG);

    auto images = listImages();
    if(platform) {
        images.erase(std::remove_if(images.begin(), images.end(),
                                    [&platform](const std::shared_ptr<const LocalImage>& image) {
                                        return !isMatchingPlatform(image->getPlatform(), *platform);
                                    }),
                     images.end());
    }

    auto result = lookupImageByID(name, images);
    if(!result) {
        result = lookupImageByName(name, images);
    }

    if(!result) {
        auto message = boost::format("%s: image not known") % name;
        HOIST_THROW_TYPED_ERROR(libhoist::ImageNotFoundError, message.str());
    }

    printLog(boost::format("Found image %s for '%s'") % result->image->getID() % name, libhoist::LogLevel::DEBUG);
    return *result;
}

std::vector<std::shared_ptr<const LocalImage>> LocalImageStore::listImages() const {
    auto images = std::vector<std::shared_ptr<const LocalImage>>{};

    try {
        auto repositoryMetadata = readRepositoryMetadata();
        for(const auto& imageMetadata : repositoryMetadata["images"].GetArray()) {
            images.push_back(convertImageMetadataToLocalImage(imageMetadata));
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to list images of repository metadata file %s") % metadataFile;
        HOIST_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Read %d images from repository metadata") % images.size(), libhoist::LogLevel::DEBUG);
    return images;
}

rapidjson::Document LocalImageStore::readRepositoryMetadata() const {
    // a repository that was never written to has no directory to hold the lock file
    auto lock = std::unique_ptr<libhoist::Lockfile>{};
    if(boost::filesystem::is_directory(metadataFile.parent_path())) {
        lock = std::make_unique<libhoist::Lockfile>(metadataFile, lockTimeoutMs);
    }

    if(!boost::filesystem::exists(metadataFile)) {
        printLog(boost::format("Repository metadata file %s does not exist yet") % metadataFile,
                 libhoist::LogLevel::DEBUG);
        auto metadata = rj::Document{rj::kObjectType};
        metadata.AddMember("images", rj::Value{rj::kArrayType}, metadata.GetAllocator());
        return metadata;
    }

    auto metadata = libhoist::json::read(metadataFile);
    if(!metadata.IsObject() || !metadata.HasMember("images") || !metadata["images"].IsArray()) {
        auto message = boost::format("Malformed repository metadata file %s: expected an \"images\" array") % metadataFile;
        HOIST_THROW_ERROR(message.str());
    }
    return metadata;
}

std::shared_ptr<const LocalImage> LocalImageStore::convertImageMetadataToLocalImage(const rapidjson::Value& imageMetadata) const {
    auto names = std::vector<common::ImageReference>{};
    auto itr = imageMetadata.FindMember("names");
    if(itr != imageMetadata.MemberEnd()) {
        for(const auto& name : itr->value.GetArray()) {
            auto reference = common::parseNamedReference(name.GetString());
            if(!reference) {
                auto message = boost::format("Invalid image name '%s' in repository metadata") % name.GetString();
                HOIST_THROW_ERROR(message.str());
            }
            names.push_back(*reference);
        }
    }

    auto platform = Platform{};
    itr = imageMetadata.FindMember("platform");
    if(itr != imageMetadata.MemberEnd()) {
        const auto& platformMetadata = itr->value;
        platform.os = platformMetadata["os"].GetString();
        platform.architecture = platformMetadata["architecture"].GetString();
        if(platformMetadata.HasMember("variant")) {
            platform.variant = platformMetadata["variant"].GetString();
        }
    }

    return std::make_shared<const LocalImage>(
        imageMetadata["id"].GetString(),
        names,
        boost::filesystem::path{imageMetadata["layout"].GetString()},
        platform);
}

/**
 * An ID may be given in full, with or without the "sha256:" prefix,
 * or as a prefix that identifies a single image.
 */
boost::optional<LookupResult> LocalImageStore::lookupImageByID(const std::string& name,
                                                               const std::vector<std::shared_ptr<const LocalImage>>& images) const {
    auto candidate = name;
    if(boost::starts_with(candidate, "sha256:")) {
        candidate = candidate.substr(std::string{"sha256:"}.size());
    }

    if(!libhoist::string::isHexadecimal(candidate)) {
        return boost::none;
    }

    auto matches = std::vector<std::shared_ptr<const LocalImage>>{};
    for(const auto& image : images) {
        if(image->getID() == candidate) {
            return LookupResult{image, name};
        }
        if(boost::starts_with(image->getID(), candidate)) {
            matches.push_back(image);
        }
    }

    if(matches.size() > 1) {
        auto message = boost::format("The image ID prefix '%s' is ambiguous: it matches %d images")
            % candidate % matches.size();
        HOIST_THROW_ERROR(message.str());
    }
    if(matches.size() == 1) {
        return LookupResult{matches.front(), name};
    }
    return boost::none;
}

boost::optional<LookupResult> LocalImageStore::lookupImageByName(const std::string& name,
                                                                 const std::vector<std::shared_ptr<const LocalImage>>& images) const {
    if(!common::parseNamedReference(name)) {
        printLog(boost::format("'%s' is not a valid image reference") % name, libhoist::LogLevel::DEBUG);
        return boost::none;
    }

    auto reference = common::parseImageReference(name).normalize();
    for(const auto& image : images) {
        for(const auto& imageName : image->getNames()) {
            auto normalizedName = imageName;
            if(normalizedName.tag.empty() && normalizedName.digest.empty()) {
                normalizedName.tag = common::ImageReference::DEFAULT_TAG;
            }
            if(normalizedName.normalize() == reference) {
                return LookupResult{image, reference.string()};
            }
        }
    }
    return boost::none;
}

void LocalImageStore::printLog(const boost::format& message, libhoist::LogLevel LogLevel,
                               std::ostream& out, std::ostream& err) const {
    printLog(message.str(), LogLevel, out, err);
}

void LocalImageStore::printLog(const std::string& message, libhoist::LogLevel LogLevel,
                               std::ostream& out, std::ostream& err) const {
    libhoist::Logger::getInstance().log(message, sysname, LogLevel, out, err);
}

} // namespace
} // namespace
