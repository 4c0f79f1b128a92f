/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "snapshot_store.h"
#include "config.h"
#include "platform_fs.h"
#include "record_codec.h"
#include "../errors.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace msgtrack {
namespace persist {

namespace fs = std::filesystem;

std::string SnapshotStore::temp_path_for(const std::string& path) {
    return path + snapshot::kTempSuffix;
}

void SnapshotStore::write(const std::string& path, const std::deque<Record>& records) const {
    // Ensure directory exists
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        FSResult dir_res = PlatformFS::ensure_directory(parent.string());
        if (!dir_res.ok) {
            throw IOError("cannot create snapshot directory (" + errnoWithDescription(dir_res.err) + ")",
                          parent.string());
        }
    }

    // Serialize to JSON
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key(snapshot::kVersionKey);
    writer.Uint(snapshot::kFormatVersion);
    writer.Key(snapshot::kRecordsKey);
    writer.StartArray();
    for (const auto& r : records) {
        record_codec::write(writer, r);
    }
    writer.EndArray();
    writer.EndObject();

    const std::string temp_path = temp_path_for(path);

    // Write to temp file (binary mode for cross-platform consistency)
    {
        std::ofstream file(temp_path, std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            throw IOError("cannot create snapshot (" + errnoWithDescription() + ")", temp_path);
        }
        file.write(buffer.GetString(), static_cast<std::streamsize>(buffer.GetSize()));
        file.flush();
        if (!file.good()) {
            file.close();
            remove_orphaned_temp(path);
            throw IOError("snapshot write failed", temp_path);
        }
    }

    FSResult res{true, 0};
    if (sync_writes_) {
        // Sync temp file, then atomic rename + directory fsync
        res = PlatformFS::sync_file(temp_path);
        if (res.ok) {
            res = PlatformFS::atomic_replace(temp_path, path);
        }
    } else {
        res = PlatformFS::rename(temp_path, path);
    }

    if (!res.ok) {
        remove_orphaned_temp(path);
        throw IOError("cannot replace snapshot (" + errnoWithDescription(res.err) + ")", path);
    }

    debug() << "snapshot " << path << " written with " << records.size() << " record(s)";
}

std::optional<std::deque<Record>> SnapshotStore::read(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw IOError("cannot stat snapshot (" + ec.message() + ")", path);
        }
        return std::nullopt;
    }

    // Read entire file (binary mode for consistency)
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("cannot open snapshot (" + errnoWithDescription() + ")", path);
    }
    std::stringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw IOError("snapshot read failed", path);
    }
    const std::string json_str = content.str();

    rapidjson::Document doc;
    doc.Parse(json_str.data(), json_str.size());

    // Check for parse errors
    if (doc.HasParseError()) {
        throw CorruptDataError(std::string("snapshot JSON parse error at offset ") +
                               std::to_string(doc.GetErrorOffset()) + ": " +
                               rapidjson::GetParseError_En(doc.GetParseError()), path);
    }

    if (!doc.IsObject()) {
        throw CorruptDataError("snapshot is not a JSON object", path);
    }

    if (doc.HasMember(snapshot::kVersionKey)) {
        const auto& v = doc[snapshot::kVersionKey];
        if (!v.IsUint() || v.GetUint() > snapshot::kFormatVersion) {
            throw CorruptDataError("unsupported snapshot version", path);
        }
    }

    if (!doc.HasMember(snapshot::kRecordsKey) || !doc[snapshot::kRecordsKey].IsArray()) {
        throw CorruptDataError("snapshot has no records array", path);
    }

    const auto& arr = doc[snapshot::kRecordsKey];
    std::deque<Record> records;
    for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
        Record r;
        std::string why;
        if (!record_codec::read(arr[i], &r, &why)) {
            throw CorruptDataError("snapshot record #" + std::to_string(i) + ": " + why, path);
        }
        records.push_back(std::move(r));
    }

    return records;
}

bool SnapshotStore::remove_orphaned_temp(const std::string& path) const {
    const std::string temp_path = temp_path_for(path);
    std::error_code ec;
    if (!fs::exists(temp_path, ec)) {
        return false;
    }
    FSResult res = PlatformFS::remove(temp_path);
    if (!res.ok) {
        warning() << "cannot remove snapshot temp file " << temp_path << ": " << errnoWithDescription(res.err);
        return false;
    }
    return true;
}

} // namespace persist
} // namespace msgtrack
