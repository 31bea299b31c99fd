/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_utility_json_hpp
#define libhoist_utility_json_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

/**
 * JSON documents: parsing, schema validation and persistence
 */

namespace libhoist {
namespace json {

rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);
// Throws with a report of the first violation when the document doesn't match the schema
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);
// Replaces the file atomically (temporary file + rename)
void write(const rapidjson::Value& json, const boost::filesystem::path& filename);
std::string serialize(const rapidjson::Value& json);

}}

#endif
