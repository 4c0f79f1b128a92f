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
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "crumb_name.h"
#include "journal_writer.h"
#include "../record.h"

namespace msgtrack {
    namespace persist {

        // Replays the crumbs left in a journal directory after an unclean shutdown.
        //
        // Files in the crumb namespace ("cr-", ".cr-") that do not parse, such as
        // temp files of torn writes, are deleted with a warning. Files outside
        // that namespace are left alone. Neither kind reaches `apply`.
        // All remaining bodies are decoded before the first `apply` call, so a
        // corrupt body throws CorruptDataError with nothing applied.
        // Replayed crumbs stay on disk; the caller's next snapshot compacts them.
        class CrumbReplay {
        public:
            struct Result {
                size_t applied = 0;      // classified crumbs handed to apply
                size_t discarded = 0;    // malformed files deleted
                size_t foreign = 0;      // non-crumb files left in place
            };

            using ApplyFn = std::function<void(CrumbKind, const Record&)>;

            explicit CrumbReplay(const JournalWriter& journal) : journal_(journal) {}

            // Applies crumbs in chronological order
            Result run(const ApplyFn& apply);

        private:
            struct Pending {
                CrumbName name;
                std::string filename;
                Record record;
            };

            const JournalWriter& journal_;
        };

    } // namespace persist
} // namespace msgtrack
