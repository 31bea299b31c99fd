/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_image_store_LocalImageStore_hpp
#define hoist_image_store_LocalImageStore_hpp

#include <string>
#include <vector>
#include <memory>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libhoist/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "image_store/Image.hpp"


namespace hoist {
namespace image_store {

class LocalImage : public Image {
public:
    LocalImage(const std::string& id,
               const std::vector<common::ImageReference>& names,
               const boost::filesystem::path& layout,
               const Platform& platform);

    const std::string& getID() const override { return id; }
    transport::Reference getStorageReference() const override;
    std::vector<common::ImageReference> getNamedTaggedRepoTags() const override;

    const std::vector<common::ImageReference>& getNames() const { return names; }
    const Platform& getPlatform() const { return platform; }

private:
    std::string id;
    std::vector<common::ImageReference> names;
    boost::filesystem::path layout;
    Platform platform;
};

/**
 * Image store backed by the metadata file of the local repository.
 */
class LocalImageStore : public ImageStore {
public:
    LocalImageStore(std::shared_ptr<const common::Config>);

    LookupResult lookupImage(const std::string& name,
                             const boost::optional<Platform>& platform = boost::none) const override;
    std::vector<std::shared_ptr<const LocalImage>> listImages() const;
    const boost::filesystem::path& getRepositoryMetadataFile() const { return metadataFile; }

private:
    rapidjson::Document readRepositoryMetadata() const;
    std::shared_ptr<const LocalImage> convertImageMetadataToLocalImage(const rapidjson::Value& imageMetadata) const;
    boost::optional<LookupResult> lookupImageByID(const std::string& name,
                                                  const std::vector<std::shared_ptr<const LocalImage>>& images) const;
    boost::optional<LookupResult> lookupImageByName(const std::string& name,
                                                    const std::vector<std::shared_ptr<const LocalImage>>& images) const;
    void printLog(const boost::format& message, libhoist::LogLevel LogLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;
    void printLog(const std::string& message, libhoist::LogLevel LogLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "LocalImageStore"; // system name for logger
    boost::filesystem::path metadataFile;
    unsigned int lockTimeoutMs = 10000;
};

bool isMatchingPlatform(const Platform& image, const Platform& requested);

} // namespace
} // namespace

#endif
