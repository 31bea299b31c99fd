/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_test_aux_fakes_hpp
#define hoist_push_test_aux_fakes_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "common/ImageReference.hpp"
#include "transport/Reference.hpp"
#include "transport/TransportRegistry.hpp"
#include "image_store/Image.hpp"
#include "push/CopyEngine.hpp"
#include "push/Event.hpp"


namespace hoist {
namespace push {
namespace test {
namespace aux {

class FakeImage : public image_store::Image {
public:
    FakeImage(const std::string& id, const std::vector<std::string>& taggedNames)
        : id{id}
    {
        for(const auto& name : taggedNames) {
            tags.push_back(common::parseImageReference(name));
        }
    }

    const std::string& getID() const override { return id; }

    transport::Reference getStorageReference() const override {
        if(!storageAvailable) {
            HOIST_THROW_ERROR("storage of fake image not available");
        }
        return transport::Reference{transport::OCI_LAYOUT_TRANSPORT, "/var/lib/hoist/images/" + id};
    }

    std::vector<common::ImageReference> getNamedTaggedRepoTags() const override { return tags; }

    std::string id;
    std::vector<common::ImageReference> tags;
    bool storageAvailable = true;
};

class FakeImageStore : public image_store::ImageStore {
public:
    void add(const std::string& name, std::shared_ptr<const image_store::Image> image, const std::string& resolvedName) {
        entries[name] = image_store::LookupResult{std::move(image), resolvedName};
    }

    image_store::LookupResult lookupImage(const std::string& name,
                                          const boost::optional<image_store::Platform>&) const override {
        auto it = entries.find(name);
        if(it == entries.cend()) {
            auto message = boost::format("%s: image not known") % name;
            HOIST_THROW_TYPED_ERROR(libhoist::ImageNotFoundError, message.str());
        }
        return it->second;
    }

private:
    std::map<std::string, image_store::LookupResult> entries;
};

// Accepts the URIs registered with 'accept', rejects everything else with "cannot parse <uri>"
class FakeTransportRegistry : public transport::TransportRegistry {
public:
    void accept(const std::string& uri, const transport::Reference& reference) {
        accepted.emplace(uri, reference);
    }

    transport::ParseResult parse(const std::string& uri) const override {
        attempts.push_back(uri);
        auto it = accepted.find(uri);
        if(it == accepted.cend()) {
            return transport::ParseResult{boost::none, "cannot parse " + uri};
        }
        return transport::ParseResult{it->second, ""};
    }

    mutable std::vector<std::string> attempts;

private:
    std::map<std::string, transport::Reference> accepted;
};

struct CopyCall {
    transport::Reference source;
    transport::Reference destination;
    CopyOptions options;
};

// Records every copy and fails on the destinations listed in 'failingDestinations'
class FakeCopyEngine : public CopyEngine {
public:
    std::string copy(const transport::Reference& source,
                     const transport::Reference& destination,
                     const CopyOptions& options) const override {
        calls.push_back(CopyCall{source, destination, options});
        for(const auto& failing : failingDestinations) {
            if(destination.string() == failing) {
                auto message = boost::format("Failed to copy image to %s") % destination;
                HOIST_THROW_TYPED_ERROR(libhoist::CopyError, message.str());
            }
        }
        return "manifest of " + destination.string();
    }

    std::vector<std::string> failingDestinations;
    mutable std::vector<CopyCall> calls;
};

class RecordingEventSink : public EventSink {
public:
    void emit(const Event& event) override {
        events.push_back(event);
    }

    std::vector<Event> events;
};

class FailingEventSink : public EventSink {
public:
    struct UnknownFailure {};

    void emit(const Event&) override {
        ++attempts;
        if(throwsUnknownFailure) {
            throw UnknownFailure{};
        }
        HOIST_THROW_ERROR("event sink is not writable");
    }

    bool throwsUnknownFailure = false;
    int attempts = 0;
};

}}}}

#endif
