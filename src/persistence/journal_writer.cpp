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

#include "journal_writer.h"
#include "config.h"
#include "platform_fs.h"
#include "record_codec.h"
#include "../errors.h"
#include "../util/log.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace msgtrack {
namespace persist {

namespace fs = std::filesystem;

static void discard_temp(const std::string& path) {
    FSResult res = PlatformFS::remove(path);
    if (!res.ok) {
        warning() << "cannot remove crumb temp file " << path << ": " << errnoWithDescription(res.err);
    }
}

JournalWriter::JournalWriter(const std::string& crumb_dir, bool sync_writes)
    : dir_(crumb_dir), sync_writes_(sync_writes) {
}

std::string JournalWriter::path_for(const std::string& filename) const {
    return (fs::path(dir_) / filename).string();
}

std::string JournalWriter::append(CrumbKind kind, const Record& record) {
    FSResult dir_res = PlatformFS::ensure_directory(dir_);
    if (!dir_res.ok) {
        throw IOError("cannot create crumb directory (" + errnoWithDescription(dir_res.err) + ")", dir_);
    }

    CrumbName name;
    name.stamp = CrumbClock::next();
    name.kind = kind;

    const std::string filename = name.filename();
    const std::string final_path = path_for(filename);
    const std::string temp_path = path_for(std::string(crumb::kTempPrefix) + filename + crumb::kTempSuffix);

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError("cannot create crumb (" + errnoWithDescription() + ")", temp_path);
        }
        out << record_codec::encode(record);
        out.flush();
        if (!out.good()) {
            out.close();
            discard_temp(temp_path);
            throw IOError("crumb write failed", temp_path);
        }
    } // ensure file is closed

    FSResult res{true, 0};
    if (sync_writes_) {
        res = PlatformFS::sync_file(temp_path);
        if (res.ok) {
            res = PlatformFS::atomic_replace(temp_path, final_path);
        }
    } else {
        res = PlatformFS::rename(temp_path, final_path);
    }

    if (!res.ok) {
        discard_temp(temp_path);
        throw IOError("cannot publish crumb (" + errnoWithDescription(res.err) + ")", final_path);
    }

    trace() << "crumb " << filename << " written for " << record.message_id;
    return filename;
}

std::vector<std::string> JournalWriter::list_files() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        return names;
    }

    fs::directory_iterator it(dir_, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        throw IOError("cannot list crumb directory (" + ec.message() + ")", dir_);
    }
    return names;
}

std::string JournalWriter::read_file(const std::string& filename) const {
    const std::string path = path_for(filename);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot open crumb (" + errnoWithDescription() + ")", path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IOError("crumb read failed", path);
    }
    return buffer.str();
}

bool JournalWriter::remove_file(const std::string& filename) const {
    FSResult res = PlatformFS::remove(path_for(filename));
    if (!res.ok) {
        warning() << "cannot delete crumb " << path_for(filename) << ": " << errnoWithDescription(res.err);
    }
    return res.ok;
}

size_t JournalWriter::remove_all() const {
    size_t removed = 0;
    size_t stuck = 0;
    for (const auto& name : list_files()) {
        if (!CrumbName::owned(name)) {
            continue;
        }
        if (remove_file(name)) {
            removed++;
        } else {
            stuck++;
        }
    }
    if (stuck > 0) {
        error() << stuck << " crumb file(s) could not be deleted from " << dir_
                << " and will replay on next load";
    }

    if (removed > 0 && sync_writes_) {
        FSResult res = PlatformFS::fsync_directory(dir_);
        if (!res.ok) {
            warning() << "fsync of crumb directory " << dir_ << " failed: " << errnoWithDescription(res.err);
        }
    }
    debug() << "removed " << removed << " crumb file(s) from " << dir_;
    return removed;
}

} // namespace persist
} // namespace msgtrack
