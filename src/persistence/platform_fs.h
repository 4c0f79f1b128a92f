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
#include <cstdint>
#include <cstddef>
#include <string>

namespace msgtrack {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // POSIX file helpers for durable small-file writes.
        class PlatformFS {
        public:
            // fdatasync an already written file by path
            static FSResult sync_file(const std::string& path);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(2) + fsync of the destination's directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);
            // rename(2) only
            static FSResult rename(const std::string& src, const std::string& dst);

            static FSResult remove(const std::string& path);

            static FSResult ensure_directory(const std::string& path);
        };

    }
} // namespace msgtrack::persist
