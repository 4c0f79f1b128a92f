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
#include <optional>
#include <string>
#include <vector>

namespace msgtrack {

    // One header line of addressees, e.g. role "To" with its address list.
    struct Recipient {
        std::string role;
        std::vector<std::string> addresses;

        bool operator==(const Recipient&) const = default;
    };

    /**
     * A tracked message.
     *
     * Built once by the caller and handed to RecordStore::insert. After
     * insertion only `group` changes (RecordStore::update_location); every
     * other field is fixed. `message_id` is the unique key and must not be
     * empty. `display_line` and `date` are opaque to the store.
     */
    struct Record {
        std::string display_line;
        std::string group;
        std::string message_id;
        std::string date;
        std::string subject;
        std::string sender;
        std::vector<Recipient> recipients;
        std::string references;
        std::optional<std::string> in_reply_to;

        bool operator==(const Record&) const = default;
    };

}
