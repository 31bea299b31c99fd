/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hoist_push_SkopeoDriver_hpp
#define hoist_push_SkopeoDriver_hpp

#include <iostream>
#include <string>
#include <memory>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libhoist/LogLevel.hpp"
#include "libhoist/CLIArguments.hpp"
#include "common/Config.hpp"
#include "push/CopyEngine.hpp"


namespace hoist {
namespace push {

class SkopeoDriver : public CopyEngine {
public:
    SkopeoDriver(std::shared_ptr<const common::Config> config);
    std::string copy(const transport::Reference& source,
                     const transport::Reference& destination,
                     const CopyOptions& options) const override;
    std::string inspectRaw(const transport::Reference& reference) const;
    libhoist::CLIArguments generateBaseArgs() const;
    libhoist::CLIArguments generateCopyArgs(const transport::Reference& source,
                                            const transport::Reference& destination,
                                            const CopyOptions& options) const;

private:
    std::string getVerbosityOption() const;
    libhoist::CLIArguments getPolicyOption() const;
    void printLog(const boost::format &message, libhoist::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void printLog(const std::string& message, libhoist::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    boost::filesystem::path skopeoPath;
    boost::filesystem::path customPolicyPath;
    bool enforceCustomPolicy;
    const std::string sysname = "SkopeoDriver";
};

}
}

#endif
