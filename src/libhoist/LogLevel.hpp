/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_LogLevel_hpp
#define libhoist_LogLevel_hpp

namespace libhoist {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
