/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_process_hpp
#define libhoist_utility_process_hpp

#include <string>
#include <ostream>

#include "libhoist/CLIArguments.hpp"

namespace libhoist {
namespace process {

/**
 * Runs args[0] (looked up in PATH) with the given arguments and waits for it.
 * Returns the exit status; 127 if the program could not be executed.
 * If childStdout is given, the standard output of the child is collected into it,
 * otherwise the child inherits the standard output of hoist.
 */
int forkExecWait(const libhoist::CLIArguments& args, std::ostream* childStdout = nullptr);
std::string getHostname();

}}

#endif
