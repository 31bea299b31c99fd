/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_transport_Reference_hpp
#define hoist_transport_Reference_hpp

#include <string>
#include <ostream>


namespace hoist {
namespace transport {

const std::string REGISTRY_TRANSPORT{"docker"};
const std::string ARCHIVE_TRANSPORT{"docker-archive"};
const std::string OCI_LAYOUT_TRANSPORT{"oci"};

/**
 * A transport-qualified image location, e.g. "docker://quay.io/ethcscs/alpine:3.18"
 * or "docker-archive:/tmp/alpine.tar". Immutable once constructed.
 */
class Reference {
public:
    Reference(const std::string& transportName, const std::string& location);

    const std::string& transportName() const { return transport; }
    const std::string& getLocation() const { return location; }
    std::string string() const;

private:
    std::string transport;
    std::string location;
};

bool operator==(const Reference&, const Reference&);
bool operator!=(const Reference&, const Reference&);
std::ostream& operator<<(std::ostream&, const Reference&);

}
}

#endif
