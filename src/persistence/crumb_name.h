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
#include <optional>
#include <string>

namespace msgtrack {
    namespace persist {

        enum class CrumbKind : uint8_t {
            New,
            Update,
            Delete
        };

        // Filename token for a kind: "new", "update", "del"
        const char* crumb_kind_token(CrumbKind kind) noexcept;

        struct CrumbStamp {
            uint64_t seconds = 0;
            uint32_t nanos = 0;   // [0, 1e9)

            bool operator==(const CrumbStamp&) const = default;
            bool operator<(const CrumbStamp& o) const noexcept {
                return seconds < o.seconds || (seconds == o.seconds && nanos < o.nanos);
            }
        };

        /**
         * Parsed form of a crumb filename.
         *
         *   cr-1718031234.000000042-update.json
         *      ^ seconds ^ nanos   ^ kind
         *
         * parse() accepts exactly the fixed-width layout that format()
         * produces and returns nullopt for anything else, including the
         * dot-prefixed temporary names used while a crumb is being written.
         */
        struct CrumbName {
            CrumbStamp stamp;
            CrumbKind kind = CrumbKind::New;

            std::string filename() const;
            static std::optional<CrumbName> parse(const std::string& filename);

            // True for names in the journal's namespace ("cr-..." or ".cr-..."),
            // whether or not they parse
            static bool owned(const std::string& filename);

            // Chronological, stamps are unique within a process
            bool operator<(const CrumbName& o) const noexcept { return stamp < o.stamp; }
        };

        // Strictly increasing stamp source shared by every journal in the process.
        // Each stamp is max(wall clock, previous + 1ns) so two crumbs written in
        // the same clock tick still sort in write order.
        class CrumbClock {
        public:
            static CrumbStamp next();
        };

    } // namespace persist
} // namespace msgtrack
