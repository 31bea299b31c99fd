/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_Lockfile_hpp
#define libhoist_Lockfile_hpp

#include <string>
#include <limits>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libhoist/LogLevel.hpp"

namespace libhoist {

/**
 * Scoped exclusive access to a file shared between hoist processes
 * (the repository metadata, the event log).
 *
 * The lock is the file "<file>.lock", created atomically and holding the PID
 * of its owner. The constructor polls until the lock file can be created or
 * the timeout expires; the destructor removes it.
 */
class Lockfile {
public:
    static constexpr unsigned int noTimeout = std::numeric_limits<unsigned int>::max();

public:
    Lockfile(const boost::filesystem::path& file, unsigned int timeoutMs=noTimeout, unsigned int warningMs=1000);
    Lockfile(const Lockfile&) = delete;
    Lockfile& operator=(const Lockfile&) = delete;
    ~Lockfile();

    const boost::filesystem::path& getPath() const { return lockfile; }

private:
    bool tryCreate() const;
    boost::optional<std::string> readOwner() const;
    void printLog(const std::string& message, libhoist::LogLevel) const;

private:
    boost::filesystem::path lockfile;
};

}

#endif
