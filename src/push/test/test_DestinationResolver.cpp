/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>

#include "libhoist/Error.hpp"
#include "transport/TransportRegistry.hpp"
#include "push/DestinationResolver.hpp"
#include "aux/fakes.hpp"
#include "libhoist/test/aux/unitTestMain.hpp"

namespace hoist {
namespace push {
namespace test {

static DestinationResolver makeResolver(const std::string& defaultTransport = "docker://") {
    return DestinationResolver{std::make_shared<transport::BuiltinTransportRegistry>(), defaultTransport};
}

TEST_GROUP(DestinationResolverTestGroup) {
};

TEST(DestinationResolverTestGroup, qualifiedDestination) {
    auto resolver = makeResolver();
    CHECK(resolver.resolve("docker://quay.io/ethcscs/alpine:3.18") == transport::Reference("docker", "//quay.io/ethcscs/alpine:3.18"));
    CHECK(resolver.resolve("oci:/tmp/alpine-layout") == transport::Reference("oci", "/tmp/alpine-layout"));
    CHECK(resolver.resolve("docker-archive:/tmp/alpine.tar") == transport::Reference("docker-archive", "/tmp/alpine.tar"));
    // a known transport wins over the default one
    CHECK(resolver.resolve("oci:alpine") == transport::Reference("oci", "alpine"));
}

TEST(DestinationResolverTestGroup, defaultTransport) {
    auto resolver = makeResolver();
    CHECK_EQUAL(resolver.getDefaultTransport(), std::string{"docker://"});
    CHECK(resolver.resolve("alpine") == transport::Reference("docker", "//alpine"));
    CHECK(resolver.resolve("quay.io/ethcscs/alpine:3.18") == transport::Reference("docker", "//quay.io/ethcscs/alpine:3.18"));
    CHECK(resolver.resolve("localhost:5000/alpine") == transport::Reference("docker", "//localhost:5000/alpine"));
}

TEST(DestinationResolverTestGroup, configuredDefaultTransport) {
    auto resolver = makeResolver("docker-archive:");
    CHECK(resolver.resolve("alpine.tar") == transport::Reference("docker-archive", "alpine.tar"));
    CHECK(resolver.resolve("docker://alpine") == transport::Reference("docker", "//alpine"));
}

TEST(DestinationResolverTestGroup, tryResolve) {
    auto resolver = makeResolver();

    auto result = resolver.tryResolve("quay.io/ethcscs/alpine");
    CHECK(result);
    CHECK(result.error.empty());

    // the error of the attempt without default transport is kept
    result = resolver.tryResolve("ftp://example.com/alpine");
    CHECK_FALSE(result);
    CHECK(result.error.find("Invalid transport \"ftp\"") != std::string::npos);

    result = resolver.tryResolve("docker:alpine");
    CHECK_FALSE(result);
    CHECK(result.error.find("does not start with //") != std::string::npos);
}

TEST(DestinationResolverTestGroup, unresolvableDestination) {
    auto resolver = makeResolver();
    CHECK_THROWS(libhoist::TransportResolutionError, resolver.resolve("ftp://example.com/alpine"));
    CHECK_THROWS(libhoist::TransportResolutionError, resolver.resolve("Alpine:3.18"));
    CHECK_THROWS(libhoist::TransportResolutionError, resolver.resolve("oci:"));
    CHECK_THROWS(libhoist::TransportResolutionError, resolver.resolve(""));
}

TEST(DestinationResolverTestGroup, attemptsOrder) {
    auto registry = std::make_shared<aux::FakeTransportRegistry>();
    registry->accept("custom:alpine", transport::Reference{"custom", "alpine"});
    auto resolver = DestinationResolver{registry, "custom:"};

    CHECK(resolver.resolve("alpine") == transport::Reference("custom", "alpine"));
    CHECK_EQUAL(registry->attempts.size(), 2);
    CHECK_EQUAL(registry->attempts[0], std::string{"alpine"});
    CHECK_EQUAL(registry->attempts[1], std::string{"custom:alpine"});

    // no fallback when the first attempt succeeds
    registry->attempts.clear();
    resolver.resolve("custom:alpine");
    CHECK_EQUAL(registry->attempts.size(), 1);

    registry->attempts.clear();
    auto result = resolver.tryResolve("ubuntu");
    CHECK_FALSE(result);
    CHECK_EQUAL(result.error, std::string{"cannot parse ubuntu"});
    CHECK_EQUAL(registry->attempts.size(), 2);
}

}}}

HOIST_UNITTEST_MAIN_FUNCTION();
