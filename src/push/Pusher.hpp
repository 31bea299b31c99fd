/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_Pusher_hpp
#define hoist_push_Pusher_hpp

#include <string>
#include <memory>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/format.hpp>

#include "libhoist/LogLevel.hpp"
#include "image_store/Image.hpp"
#include "transport/TransportRegistry.hpp"
#include "push/PushOptions.hpp"
#include "push/CopyEngine.hpp"
#include "push/Event.hpp"
#include "push/DestinationResolver.hpp"


namespace hoist {
namespace push {

class Pusher {
public:
    Pusher(std::shared_ptr<const image_store::ImageStore> imageStore,
           std::shared_ptr<const transport::TransportRegistry> transportRegistry,
           std::shared_ptr<const CopyEngine> copyEngine,
           std::shared_ptr<EventSink> eventSink,
           const std::string& defaultTransport);

    // Returns the manifest of the pushed image, or boost::none when all tags were pushed
    boost::optional<std::string> push(const std::string& source,
                                      const std::string& destination,
                                      const PushOptions& options = {}) const;
    std::string pushImage(const image_store::Image& image,
                          const std::string& destination,
                          const PushOptions& options) const;
    void pushAllTags(const image_store::Image& image,
                     const std::string& destinationBase,
                     const PushOptions& options) const;

private:
    CopyOptions makeCopyOptions(const transport::Reference& destinationReference,
                                const std::string& destination,
                                const CopyOptions& options) const;
    void printLog(const boost::format& message, libhoist::LogLevel,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;
    void printLog(const std::string& message, libhoist::LogLevel,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;

private:
    std::shared_ptr<const image_store::ImageStore> imageStore;
    std::shared_ptr<const CopyEngine> copyEngine;
    std::shared_ptr<EventSink> eventSink;
    DestinationResolver destinationResolver;
    const std::string sysname = "Pusher";
};

}
}

#endif
