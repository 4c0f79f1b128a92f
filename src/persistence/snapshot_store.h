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

#pragma once
#include <deque>
#include <optional>
#include <string>
#include "../record.h"

namespace msgtrack {
namespace persist {

/**
 * SnapshotStore - JSON file holding the whole ordered collection
 *
 * Contains:
 * - Format version
 * - Records, most recent first
 *
 * Written atomically via temp + rename pattern
 */
class SnapshotStore {
public:
    explicit SnapshotStore(bool sync_writes = true) : sync_writes_(sync_writes) {}

    // Replace the snapshot at `path` with `records`. Creates parent
    // directories. Throws IOError; the previous snapshot survives any failure.
    void write(const std::string& path, const std::deque<Record>& records) const;

    // nullopt if `path` does not exist. Throws CorruptDataError if the file
    // is not a valid snapshot, IOError if it cannot be read.
    std::optional<std::deque<Record>> read(const std::string& path) const;

    // Remove a leftover <path>.tmp from an interrupted write. True if one was removed.
    bool remove_orphaned_temp(const std::string& path) const;

    // Helper to generate the temp path for a snapshot
    static std::string temp_path_for(const std::string& path);

private:
    bool sync_writes_;
};

} // namespace persist
} // namespace msgtrack
