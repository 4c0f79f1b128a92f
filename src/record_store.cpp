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

#include "record_store.h"
#include "persistence/crumb_replay.h"
#include "util/log.h"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace msgtrack {

    RecordStore::RecordStore(const persist::StoreConfig& config)
        : config_(config),
          journal_(config.crumb_dir, config.sync_writes),
          snapshots_(config.sync_writes) {
        if (!config_.validate()) {
            throw std::invalid_argument("invalid store configuration (snapshot '" + config_.snapshot_path +
                                        "', crumbs '" + config_.crumb_dir + "')");
        }
        debug() << "RecordStore snapshot=" << config_.snapshot_path << " crumbs=" << config_.crumb_dir
                << " sync=" << (config_.sync_writes ? "on" : "off");
    }

    std::deque<Record>::iterator RecordStore::locate(const std::string& message_id) {
        return std::find_if(records_.begin(), records_.end(),
                            [&](const Record& r) { return r.message_id == message_id; });
    }

    std::deque<Record>::const_iterator RecordStore::locate(const std::string& message_id) const {
        return std::find_if(records_.begin(), records_.end(),
                            [&](const Record& r) { return r.message_id == message_id; });
    }

    void RecordStore::journal(persist::CrumbKind kind, const Record& record) {
        try {
            std::string name = journal_.append(kind, record);
            trace() << "crumb " << name << " for " << record.message_id;
        } catch (const IOError& e) {
            error() << "crumb write failed for " << record.message_id << ": " << e.what();
            throw;
        }
    }

    std::optional<Record> RecordStore::find(const std::string& message_id) const {
        auto it = locate(message_id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<Record> RecordStore::find_all(const Predicate& pred) const {
        std::vector<Record> out;
        std::copy_if(records_.begin(), records_.end(), std::back_inserter(out), pred);
        return out;
    }

    void RecordStore::insert(const Record& record, bool persist) {
        if (record.message_id.empty()) {
            throw std::invalid_argument("record has an empty message_id");
        }
        if (locate(record.message_id) != records_.end()) {
            trace() << "insert " << record.message_id << ": already tracked";
            return;
        }
        records_.push_front(record);
        debug() << "insert " << record.message_id << " in " << record.group;
        if (persist) {
            journal(persist::CrumbKind::New, record);
        }
    }

    void RecordStore::update_location(const std::string& message_id, const std::string& new_group,
                                      bool persist) {
        auto it = locate(message_id);
        if (it == records_.end()) {
            trace() << "update_location " << message_id << ": not tracked";
            return;
        }
        debug() << "update_location " << message_id << ": " << it->group << " -> " << new_group;
        it->group = new_group;
        if (persist) {
            journal(persist::CrumbKind::Update, *it);
        }
    }

    bool RecordStore::remove(const std::string& message_id, bool persist) {
        auto it = locate(message_id);
        if (it == records_.end()) {
            trace() << "remove " << message_id << ": not tracked";
            return false;
        }
        Record removed = std::move(*it);
        records_.erase(it);
        debug() << "remove " << message_id;
        if (persist) {
            journal(persist::CrumbKind::Delete, removed);
        }
        return true;
    }

    void RecordStore::remove_all() {
        size_t dropped = records_.size();
        records_.clear();
        size_t crumbs = journal_.remove_all();
        info() << "forgot " << dropped << " record(s), removed " << crumbs << " crumb(s)";
    }

    Record RecordStore::rotate_forward() {
        if (records_.empty()) {
            throw EmptyCollectionError();
        }
        records_.push_back(std::move(records_.front()));
        records_.pop_front();
        return records_.back();
    }

    Record RecordStore::rotate_backward() {
        if (records_.empty()) {
            throw EmptyCollectionError();
        }
        records_.push_front(std::move(records_.back()));
        records_.pop_back();
        return records_.front();
    }

    std::optional<Record> RecordStore::current() const {
        if (records_.empty()) {
            return std::nullopt;
        }
        return records_.front();
    }

    void RecordStore::save(const std::string& path) {
        auto start_time = std::chrono::steady_clock::now();
        try {
            snapshots_.write(path, records_);
        } catch (const IOError& e) {
            error() << "save to " << path << " failed: " << e.what();
            throw;
        }

        // Snapshot is durable. Crumbs that survive compaction replay on the
        // next load against this newer snapshot, which can undo later changes
        size_t compacted = 0;
        try {
            compacted = journal_.remove_all();
        } catch (const IOError& e) {
            error() << "crumb compaction after save to " << path << " failed, stale crumbs will replay on next load: "
                    << e.what();
        }

        auto save_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        info() << "saved " << records_.size() << " record(s) to " << path << ", compacted "
               << compacted << " crumb(s) in " << static_cast<long long>(save_ms) << " ms";
    }

    size_t RecordStore::load(const std::string& path) {
        std::optional<std::deque<Record>> loaded;
        try {
            loaded = snapshots_.read(path);
        } catch (const StoreError& e) {
            error() << "load from " << path << " failed: " << e.what();
            throw;
        }

        std::deque<Record> next;
        if (loaded) {
            std::unordered_set<std::string> seen;
            for (auto& r : *loaded) {
                if (!seen.insert(r.message_id).second) {
                    warning() << "snapshot " << path << " repeats " << r.message_id << ", dropping copy";
                    continue;
                }
                next.push_back(std::move(r));
            }
        } else {
            debug() << "no snapshot at " << path << ", starting empty";
        }

        std::deque<Record> previous = std::move(records_);
        records_ = std::move(next);

        persist::CrumbReplay::Result replayed;
        try {
            persist::CrumbReplay replay(journal_);
            replayed = replay.run([this](persist::CrumbKind kind, const Record& r) {
                switch (kind) {
                    case persist::CrumbKind::New:
                        insert(r, false);
                        break;
                    case persist::CrumbKind::Update:
                        update_location(r.message_id, r.group, false);
                        break;
                    case persist::CrumbKind::Delete:
                        remove(r.message_id, false);
                        break;
                }
            });
        } catch (const StoreError& e) {
            records_ = std::move(previous);
            error() << "crumb replay from " << journal_.directory() << " failed: " << e.what();
            throw;
        }

        if (snapshots_.remove_orphaned_temp(path)) {
            warning() << "removed temp file of an interrupted save: " << persist::SnapshotStore::temp_path_for(path);
        }

        if (replayed.discarded > 0) {
            warning() << "discarded " << replayed.discarded << " malformed crumb file(s)";
        }

        if (replayed.applied > 0) {
            info() << "recovered " << replayed.applied << " crumb(s), re-saving " << path;
            save(path);
        }

        info() << "loaded " << records_.size() << " record(s) from " << path;
        return replayed.applied;
    }

}
