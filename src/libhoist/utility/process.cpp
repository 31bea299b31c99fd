/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <memory>
#include <cerrno>
#include <cstring>
#include <limits.h>
#include <unistd.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libhoist/Error.hpp"
#include "libhoist/utility/logging.hpp"

namespace libhoist {
namespace process {

namespace {

class Pipe {
public:
    Pipe() {
        if(pipe(fds) == -1) {
            auto message = boost::format("Failed to create pipe: %s") % std::strerror(errno);
            HOIST_THROW_ERROR(message.str());
        }
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        closeReadEnd();
        closeWriteEnd();
    }

    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeReadEnd() { closeEnd(fds[0]); }
    void closeWriteEnd() { closeEnd(fds[1]); }

private:
    static void closeEnd(int& fd) {
        if(fd != -1) {
            close(fd);
            fd = -1;
        }
    }

private:
    int fds[2] = {-1, -1};
};

void drain(int fd, std::ostream& out) {
    char buffer[4096];
    while(true) {
        auto count = read(fd, buffer, sizeof(buffer));
        if(count == 0) {
            return;
        }
        if(count == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to read output of subprocess: %s") % std::strerror(errno);
            HOIST_THROW_ERROR(message.str());
        }
        out.write(buffer, count);
    }
}

int waitForExit(pid_t pid, const libhoist::CLIArguments& args) {
    int status;
    while(waitpid(pid, &status, 0) == -1) {
        if(errno != EINTR) {
            auto message = boost::format("Failed to wait for subprocess %s: %s") % args % std::strerror(errno);
            HOIST_THROW_ERROR(message.str());
        }
    }
    if(WIFSIGNALED(status)) {
        auto message = boost::format("Subprocess %s was killed by signal %d") % args % WTERMSIG(status);
        HOIST_THROW_ERROR(message.str());
    }
    return WEXITSTATUS(status);
}

}

int forkExecWait(const libhoist::CLIArguments& args, std::ostream* childStdout) {
    logMessage(boost::format("Executing %s") % args, LogLevel::DEBUG);

    if(args.empty()) {
        HOIST_THROW_ERROR("Failed to execute subprocess: empty command line");
    }

    auto output = std::unique_ptr<Pipe>{};
    if(childStdout) {
        output = std::make_unique<Pipe>();
    }

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s") % args % std::strerror(errno);
        HOIST_THROW_ERROR(message.str());
    }

    if(pid == 0) {
        if(output) {
            dup2(output->writeEnd(), STDOUT_FILENO);
            output->closeReadEnd();
            output->closeWriteEnd();
        }
        auto argv = args.argv();
        execvp(argv[0], argv);
        // the child must not unwind the stack of the parent
        dprintf(STDERR_FILENO, "Failed to execute %s: %s\n", argv[0], std::strerror(errno));
        _exit(127);
    }

    if(output) {
        output->closeWriteEnd();
        try {
            drain(output->readEnd(), *childStdout);
        }
        catch(const libhoist::Error& e) {
            waitForExit(pid, args);
            auto message = boost::format("Failed to collect standard output of %s") % args;
            HOIST_RETHROW_ERROR(e, message.str());
        }
    }

    auto status = waitForExit(pid, args);
    logMessage(boost::format("%s (pid %d) exited with status %d") % args % pid % status, LogLevel::DEBUG);
    return status;
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX + 1] = {};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0) {
        auto message = boost::format("Failed to retrieve hostname: %s") % std::strerror(errno);
        HOIST_THROW_ERROR(message.str());
    }
    return hostname;
}

}}
