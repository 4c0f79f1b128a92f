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
#include <string>
#include <vector>
#include "crumb_name.h"
#include "../record.h"

namespace msgtrack {
    namespace persist {

        // JournalWriter: one crumb file per record mutation
        //
        // WRITE PROTOCOL:
        // - body is written to .<name>.tmp, optionally fdatasync'd
        // - then renamed to <name> (and the directory fsync'd when syncing)
        // - a crash before the rename leaves only the temp file, which the
        //   replay classifies as malformed and discards
        //
        // The writer keeps no record state; the directory listing is the
        // journal. It assumes it is the only writer of its directory.
        class JournalWriter {
        public:
            explicit JournalWriter(const std::string& crumb_dir, bool sync_writes = true);

            // Persists `record` as a crumb of the given kind and returns the
            // crumb's filename. Throws IOError if the crumb cannot be created.
            std::string append(CrumbKind kind, const Record& record);

            // Every regular file currently in the crumb directory (names only,
            // unsorted). A missing directory yields an empty list.
            std::vector<std::string> list_files() const;

            // Body of one file in the crumb directory. Throws IOError.
            std::string read_file(const std::string& filename) const;

            // Deletes one file from the crumb directory; false if it could
            // not be removed (missing files count as removed).
            bool remove_file(const std::string& filename) const;

            // Deletes every crumb and crumb temp file. Returns how many files
            // were removed; failures are logged and skipped.
            size_t remove_all() const;

            const std::string& directory() const noexcept { return dir_; }
            bool sync_writes() const noexcept { return sync_writes_; }

        private:
            std::string path_for(const std::string& filename) const;

            std::string dir_;
            bool sync_writes_;
        };

    } // namespace persist
} // namespace msgtrack
