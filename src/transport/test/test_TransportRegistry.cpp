/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>

#include "transport/Reference.hpp"
#include "transport/TransportRegistry.hpp"
#include "libhoist/test/aux/unitTestMain.hpp"

namespace hoist {
namespace transport {
namespace test {

TEST_GROUP(TransportRegistryTestGroup) {
};

static void checkParsed(const std::string& uri, const std::string& transportName, const std::string& location) {
    auto result = BuiltinTransportRegistry{}.parse(uri);
    CHECK(result);
    CHECK(result.error.empty());
    CHECK_EQUAL(result.reference->transportName(), transportName);
    CHECK_EQUAL(result.reference->getLocation(), location);
    CHECK_EQUAL(result.reference->string(), uri);
}

static void checkRejected(const std::string& uri, const std::string& expectedErrorSubstring) {
    auto result = BuiltinTransportRegistry{}.parse(uri);
    CHECK_FALSE(result);
    CHECK(result.error.find(expectedErrorSubstring) != std::string::npos);
}

TEST(TransportRegistryTestGroup, registryTransport) {
    checkParsed("docker://alpine", REGISTRY_TRANSPORT, "//alpine");
    checkParsed("docker://quay.io/ethcscs/alpine:3.18", REGISTRY_TRANSPORT, "//quay.io/ethcscs/alpine:3.18");
    checkParsed("docker://localhost:5000/alpine", REGISTRY_TRANSPORT, "//localhost:5000/alpine");

    checkRejected("docker:alpine", "does not start with //");
    checkRejected("docker://Alpine", "invalid reference format");
    checkRejected("docker://alpine:", "invalid reference format");
    checkRejected("docker://ns/../alpine", "invalid reference format");
}

TEST(TransportRegistryTestGroup, archiveTransport) {
    checkParsed("docker-archive:/tmp/alpine.tar", ARCHIVE_TRANSPORT, "/tmp/alpine.tar");
    checkParsed("docker-archive:/tmp/alpine.tar:alpine:3.18", ARCHIVE_TRANSPORT, "/tmp/alpine.tar:alpine:3.18");
    checkParsed("docker-archive:alpine.tar", ARCHIVE_TRANSPORT, "alpine.tar");

    checkRejected("docker-archive:", "empty path");
    checkRejected("docker-archive::alpine", "empty path");
    checkRejected("docker-archive:/tmp/alpine.tar:Alpine", "invalid reference format");
}

TEST(TransportRegistryTestGroup, pathTransports) {
    checkParsed("oci:/tmp/layout", OCI_LAYOUT_TRANSPORT, "/tmp/layout");
    checkParsed("oci:/tmp/layout:3.18", OCI_LAYOUT_TRANSPORT, "/tmp/layout:3.18");
    checkParsed("oci-archive:/tmp/alpine.tar", "oci-archive", "/tmp/alpine.tar");
    checkParsed("dir:/tmp/alpine", "dir", "/tmp/alpine");

    checkRejected("oci:", "path must not be empty");
    checkRejected("dir:", "path must not be empty");
}

TEST(TransportRegistryTestGroup, missingOrUnknownTransport) {
    checkRejected("alpine", "expected colon-separated transport:reference");
    checkRejected("/tmp/alpine.tar", "expected colon-separated transport:reference");
    checkRejected("ftp://alpine", "Invalid transport \"ftp\"");
    // a tagged short name looks like an unknown transport
    checkRejected("alpine:3.18", "Invalid transport \"alpine\"");
}

TEST(TransportRegistryTestGroup, referenceComparison) {
    auto reference = Reference{"oci", "/tmp/layout"};
    CHECK(reference == Reference("oci", "/tmp/layout"));
    CHECK(reference != Reference("oci", "/tmp/other"));
    CHECK(reference != Reference("dir", "/tmp/layout"));

    std::stringstream os;
    os << reference;
    CHECK_EQUAL(os.str(), std::string{"oci:/tmp/layout"});
}

}}}

HOIST_UNITTEST_MAIN_FUNCTION();
