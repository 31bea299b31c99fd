/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_Utility_hpp
#define libhoist_Utility_hpp

/*
 * All utility headers.
 */

#include "libhoist/utility/environment.hpp"
#include "libhoist/utility/filesystem.hpp"
#include "libhoist/utility/json.hpp"
#include "libhoist/utility/logging.hpp"
#include "libhoist/utility/process.hpp"
#include "libhoist/utility/string.hpp"

#endif
