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

namespace msgtrack {
namespace persist {

// Snapshot file configuration
namespace snapshot {
    constexpr uint32_t kFormatVersion = 1;
    constexpr const char* kVersionKey = "version";
    constexpr const char* kRecordsKey = "records";
    constexpr const char* kTempSuffix = ".tmp";                 // <snapshot>.tmp during save
}

// Crumb file naming: cr-<seconds>.<nanos>-<kind>.json
//
// Both numeric fields are zero padded to a fixed width so that a plain
// lexicographic sort of the names matches chronological order.
namespace crumb {
    constexpr const char* kPrefix = "cr-";
    constexpr const char* kExtension = ".json";
    constexpr const char* kTempPrefix = ".";                     // .cr-...json.tmp while writing
    constexpr const char* kTempSuffix = ".tmp";
    constexpr size_t kSecondsWidth = 10;                        // good until year 2286
    constexpr size_t kNanosWidth = 9;
    constexpr uint32_t kNanosPerSecond = 1000000000u;

    constexpr const char* kKindNew = "new";
    constexpr const char* kKindUpdate = "update";
    constexpr const char* kKindDelete = "del";
}

// File naming configuration
namespace files {
    constexpr const char* kAppDir = "msgtrack";
    constexpr const char* kSnapshotFile = "msgtrack.json";
    constexpr const char* kCrumbDir = "crumbs";
}

} // namespace persist
} // namespace msgtrack
