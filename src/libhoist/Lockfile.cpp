/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Lockfile.hpp"

#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/Logger.hpp"

namespace libhoist {

Lockfile::Lockfile(const boost::filesystem::path& file, unsigned int timeoutMs, unsigned int warningMs)
    : lockfile{file.string() + ".lock"}
{
    printLog((boost::format("acquiring lock %s") % lockfile).str(), LogLevel::DEBUG);

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const auto backoff = std::chrono::milliseconds(100);
    auto nextWarning = std::chrono::milliseconds(warningMs);

    while(!tryCreate()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

        if(timeoutMs != noTimeout && elapsed.count() >= timeoutMs) {
            auto owner = readOwner();
            auto message = boost::format("Failed to acquire lock %s within %d ms (held by process %s)")
                % lockfile % timeoutMs % (owner ? *owner : std::string{"<unknown>"});
            HOIST_THROW_ERROR(message.str());
        }
        if(elapsed >= nextWarning) {
            auto message = boost::format("Still waiting for lock %s after %d ms") % lockfile % elapsed.count();
            printLog(message.str(), LogLevel::WARN);
            nextWarning += std::chrono::milliseconds(warningMs);
        }

        std::this_thread::sleep_for(backoff);
    }

    printLog((boost::format("acquired lock %s") % lockfile).str(), LogLevel::DEBUG);
}

Lockfile::~Lockfile() {
    boost::system::error_code ec;
    boost::filesystem::remove(lockfile, ec);
    if(ec) {
        auto message = boost::format("Failed to remove lock %s: %s") % lockfile % ec.message();
        printLog(message.str(), LogLevel::WARN);
        return;
    }
    printLog((boost::format("released lock %s") % lockfile).str(), LogLevel::DEBUG);
}

bool Lockfile::tryCreate() const {
    auto fd = ::open(lockfile.c_str(), O_CREAT | O_EXCL | O_WRONLY, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if(fd == -1) {
        if(errno == EEXIST) {
            return false;
        }
        auto message = boost::format("Failed to create lock %s: %s") % lockfile % std::strerror(errno);
        HOIST_THROW_ERROR(message.str());
    }

    auto pid = std::to_string(getpid()) + "\n";
    auto written = ::write(fd, pid.c_str(), pid.size());
    if(::close(fd) != 0 || written != static_cast<ssize_t>(pid.size())) {
        boost::filesystem::remove(lockfile);
        auto message = boost::format("Failed to write owner of lock %s") % lockfile;
        HOIST_THROW_ERROR(message.str());
    }
    return true;
}

boost::optional<std::string> Lockfile::readOwner() const {
    std::ifstream is(lockfile.string());
    std::string pid;
    if(!std::getline(is, pid)) {
        return boost::none;
    }
    boost::algorithm::trim(pid);
    if(pid.empty()) {
        return boost::none;
    }
    return pid;
}

void Lockfile::printLog(const std::string& message, libhoist::LogLevel level) const {
    Logger::getInstance().log(message, "Lockfile", level);
}

}
