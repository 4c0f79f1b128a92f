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

#include "crumb_replay.h"
#include "record_codec.h"
#include "../errors.h"
#include "../util/log.h"
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace msgtrack {
namespace persist {

CrumbReplay::Result CrumbReplay::run(const ApplyFn& apply) {
    auto start_time = std::chrono::steady_clock::now();
    Result result;

    // Step 1: Classify by filename
    std::vector<Pending> pending;
    for (const auto& filename : journal_.list_files()) {
        if (!CrumbName::owned(filename)) {
            warning() << "Ignoring foreign file " << filename << " in crumb directory " << journal_.directory();
            result.foreign++;
            continue;
        }
        auto name = CrumbName::parse(filename);
        if (!name) {
            warning() << "Discarding malformed crumb " << filename << " in " << journal_.directory();
            if (journal_.remove_file(filename)) {
                result.discarded++;
            }
            continue;
        }
        pending.push_back(Pending{*name, filename, Record{}});
    }

    if (pending.empty()) {
        return result;
    }

    // Step 2: Sort by stamp to ensure correct replay order
    std::sort(pending.begin(), pending.end(),
              [](const Pending& a, const Pending& b) {
                  if (a.name.stamp == b.name.stamp) {
                      return a.filename < b.filename;
                  }
                  return a.name < b.name;
              });

    // Step 3: Decode every body before touching the collection
    for (auto& p : pending) {
        std::string why;
        if (!record_codec::decode(journal_.read_file(p.filename), &p.record, &why)) {
            std::string path = (std::filesystem::path(journal_.directory()) / p.filename).string();
            error() << "Crumb " << path << " is corrupt: " << why;
            throw CorruptDataError("corrupt crumb (" + why + ")", path);
        }
    }

    // Step 4: Apply in order
    for (const auto& p : pending) {
        trace() << "[REPLAY] " << p.filename << " " << crumb_kind_token(p.name.kind)
                << " " << p.record.message_id;
        apply(p.name.kind, p.record);
        result.applied++;
    }

    auto replay_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    info() << "Replayed " << result.applied << " crumb(s) from " << journal_.directory()
           << " in " << static_cast<long long>(replay_ms) << " ms";
    return result;
}

} // namespace persist
} // namespace msgtrack
