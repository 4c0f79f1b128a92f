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
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "record.h"
#include "errors.h"
#include "persistence/store_config.h"
#include "persistence/journal_writer.h"
#include "persistence/snapshot_store.h"

namespace msgtrack {

    /**
     * Ordered, deduplicated collection of tracked messages, most recent first.
     *
     * Every mutation is applied in memory and then, unless `persist` is false,
     * journaled as one crumb file. save() writes the whole collection as a
     * snapshot and compacts the crumbs; load() reads the snapshot and replays
     * whatever crumbs an unclean shutdown left behind.
     *
     * Not thread safe. One instance per snapshot path.
     */
    class RecordStore {
    public:
        using Predicate = std::function<bool(const Record&)>;

        // Throws std::invalid_argument if `config` does not validate
        explicit RecordStore(const persist::StoreConfig& config = persist::StoreConfig::defaults());

        RecordStore(const RecordStore&) = delete;
        RecordStore& operator=(const RecordStore&) = delete;

        // ---- lookup ----
        std::optional<Record> find(const std::string& message_id) const;
        std::vector<Record> find_all(const Predicate& pred) const;

        // ---- mutation ----
        // No-op if the key is already present. Throws std::invalid_argument for
        // an empty message_id, IOError if the crumb cannot be written (the
        // record stays inserted).
        void insert(const Record& record, bool persist = true);

        // Moves a record to `new_group`; no-op if the key is absent
        void update_location(const std::string& message_id, const std::string& new_group,
                             bool persist = true);

        bool remove(const std::string& message_id, bool persist = true);

        // Forget everything: clears memory and deletes all crumbs. The
        // snapshot is replaced by the caller's next save().
        void remove_all();

        // ---- rotation ----
        // front -> back, returns the moved record. EmptyCollectionError if empty.
        Record rotate_forward();
        // back -> front, returns the moved record. EmptyCollectionError if empty.
        Record rotate_backward();

        // ---- persistence ----
        void save(const std::string& path);
        void save() { save(config_.snapshot_path); }

        // Returns the number of crumbs replayed
        size_t load(const std::string& path);
        size_t load() { return load(config_.snapshot_path); }

        // ---- accessors ----
        size_t size() const noexcept { return records_.size(); }
        bool empty() const noexcept { return records_.empty(); }
        const std::deque<Record>& records() const noexcept { return records_; }
        std::optional<Record> current() const;

        const persist::StoreConfig& config() const noexcept { return config_; }

    private:
        std::deque<Record>::iterator locate(const std::string& message_id);
        std::deque<Record>::const_iterator locate(const std::string& message_id) const;

        void journal(persist::CrumbKind kind, const Record& record);

        persist::StoreConfig config_;
        persist::JournalWriter journal_;
        persist::SnapshotStore snapshots_;
        std::deque<Record> records_;
    };

}
