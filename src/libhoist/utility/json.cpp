/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>

#include <boost/format.hpp>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/writer.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/error/en.h>

#include "libhoist/Error.hpp"
#include "libhoist/utility/filesystem.hpp"

namespace libhoist {
namespace json {

static rapidjson::Document parseOrThrow(const std::string& text, const std::string& origin) {
    auto json = rapidjson::Document{};
    json.Parse(text.c_str());
    if(json.HasParseError()) {
        auto message = boost::format("Failed to parse %s: invalid JSON at offset %u (%s)")
            % origin
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        HOIST_THROW_ERROR(message.str());
    }
    return json;
}

static std::string pointerToString(const rapidjson::Pointer& pointer) {
    rapidjson::StringBuffer sb;
    pointer.StringifyUriFragment(sb);
    return sb.GetString();
}

rapidjson::Document parse(const std::string& string) {
    return parseOrThrow(string, "JSON string '" + string + "'");
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    try {
        return parseOrThrow(filesystem::readFile(filename), "JSON file " + filename.string());
    }
    catch(const libhoist::Error& e) {
        auto message = boost::format("Failed to read JSON file %s") % filename;
        HOIST_RETHROW_ERROR(e, message.str());
    }
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schemaJSON = read(schemaFile);
    auto schema = rapidjson::SchemaDocument{schemaJSON};
    auto json = read(jsonFile);

    rapidjson::SchemaValidator validator(schema);
    if(!json.Accept(validator)) {
        rapidjson::StringBuffer report;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(report);
        validator.GetError().Accept(writer);

        auto message = boost::format("%s doesn't match schema %s: keyword '%s' violated at '%s' (schema location '%s')\n%s")
            % jsonFile % schemaFile
            % validator.GetInvalidSchemaKeyword()
            % pointerToString(validator.GetInvalidDocumentPointer())
            % pointerToString(validator.GetInvalidSchemaPointer())
            % report.GetString();
        HOIST_THROW_ERROR(message.str());
    }

    return json;
}

void write(const rapidjson::Value& json, const boost::filesystem::path& filename) {
    auto temporary = filename;
    temporary += ".tmp";

    try {
        filesystem::createFoldersIfNecessary(filename.parent_path());
        {
            std::ofstream ofs(temporary.string());
            if(!ofs) {
                auto message = boost::format("Failed to open %s for writing") % temporary;
                HOIST_THROW_ERROR(message.str());
            }
            rapidjson::OStreamWrapper osw(ofs);
            rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(osw);
            writer.SetIndent(' ', 2);
            json.Accept(writer);
            ofs << "\n";
            if(!ofs.flush()) {
                auto message = boost::format("Failed to write %s") % temporary;
                HOIST_THROW_ERROR(message.str());
            }
        }
        boost::filesystem::rename(temporary, filename);
    }
    catch(const std::exception& e) {
        boost::system::error_code ec;
        boost::filesystem::remove(temporary, ec);
        auto message = boost::format("Failed to write JSON to %s") % filename;
        HOIST_RETHROW_ERROR(e, message.str());
    }
}

std::string serialize(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

}}
